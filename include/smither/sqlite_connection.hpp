#pragma once

/**
 * @file sqlite_connection.hpp
 * @brief Connection backed by an SQLite database
 */

#include <memory>
#include <string>
#include <string_view>

#include "smither/connection.hpp"
#include "smither/status.hpp"

struct sqlite3;

namespace smither {

/**
 * @brief Connection over the sqlite3 C API
 *
 * Opens a database file, or an in-memory database when the path is
 * ":memory:". Integer columns come back as int64, REAL as double, TEXT as
 * string and BLOB as string bytes.
 */
class SqliteConnection : public Connection {
    /// Restricts construction to open() while keeping make_shared usable
    struct OpenKey {
        explicit OpenKey() = default;
    };

public:
    /**
     * @brief Open (and create if missing) a database
     * @param path File path or ":memory:"
     * @param out Receives the connection on success
     */
    [[nodiscard]] static Status open(const std::string& path,
                                     std::shared_ptr<SqliteConnection>* out);

    SqliteConnection(OpenKey key, sqlite3* db, std::string path);
    ~SqliteConnection() override;

    SqliteConnection(const SqliteConnection&) = delete;
    SqliteConnection& operator=(const SqliteConnection&) = delete;

    [[nodiscard]] Result query(std::string_view sql) override;

    /**
     * @brief Run one or more statements that return no rows (DDL, DML)
     */
    [[nodiscard]] Status execute(std::string_view sql);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
};

}  // namespace smither
