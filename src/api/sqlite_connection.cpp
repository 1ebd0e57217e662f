/**
 * @file sqlite_connection.cpp
 * @brief SqliteConnection implementation
 */

#include "smither/sqlite_connection.hpp"

#include <sqlite3.h>

#include <string>
#include <utility>
#include <vector>

#include "common/logger.hpp"

namespace smither {

namespace {

Status sqlite_error(sqlite3* db, int rc, std::string_view what) {
    std::string message(what);
    message += ": ";
    message += db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
        return Status::Busy(std::move(message));
    }
    if (rc == SQLITE_IOERR || rc == SQLITE_CANTOPEN) {
        return Status::IOError(std::move(message));
    }
    return Status::Error(std::move(message));
}

Value column_value(sqlite3_stmt* stmt, int idx) {
    switch (sqlite3_column_type(stmt, idx)) {
        case SQLITE_INTEGER:
            return Value(static_cast<int64_t>(sqlite3_column_int64(stmt, idx)));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(stmt, idx));
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, idx));
            return Value(std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, idx))));
        }
        case SQLITE_BLOB: {
            const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, idx));
            const auto size = static_cast<size_t>(sqlite3_column_bytes(stmt, idx));
            return Value(blob != nullptr ? std::string(blob, size) : std::string());
        }
        default:
            return Value();
    }
}

}  // namespace

Status SqliteConnection::open(const std::string& path,
                              std::shared_ptr<SqliteConnection>* out) {
    sqlite3* db = nullptr;
    const int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK) {
        Status status = sqlite_error(db, rc, "sqlite3_open " + path);
        sqlite3_close(db);
        return status;
    }
    LOG_INFO("Opened SQLite database: {}", path);
    *out = std::make_shared<SqliteConnection>(OpenKey{}, db, path);
    return Status::Ok();
}

SqliteConnection::SqliteConnection(OpenKey /*key*/, sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

SqliteConnection::~SqliteConnection() {
    if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result SqliteConnection::query(std::string_view sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result(sqlite_error(db_, rc, "prepare"));
    }

    const int ncols = sqlite3_column_count(stmt);

    std::vector<Row> rows;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        std::vector<Value> values;
        values.reserve(static_cast<size_t>(ncols));
        for (int i = 0; i < ncols; ++i) {
            values.push_back(column_value(stmt, i));
        }
        rows.emplace_back(std::move(values));
    }

    if (rc != SQLITE_DONE) {
        Status status = sqlite_error(db_, rc, "step");
        sqlite3_finalize(stmt);
        return Result(std::move(status));
    }
    sqlite3_finalize(stmt);
    return Result(std::move(rows));
}

Status SqliteConnection::execute(std::string_view sql) {
    char* errmsg = nullptr;
    const std::string text(sql);
    const int rc = sqlite3_exec(db_, text.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg != nullptr ? errmsg : sqlite3_errstr(rc);
        if (errmsg != nullptr) {
            sqlite3_free(errmsg);
        }
        return Status::Error("sqlite3_exec: " + message);
    }
    return Status::Ok();
}

}  // namespace smither
