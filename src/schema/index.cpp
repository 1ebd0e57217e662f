/**
 * @file index.cpp
 * @brief IndexDef rendering
 */

#include "schema/index.hpp"

#include "common/macros.hpp"

namespace smither {

std::string_view to_string(SortDirection direction) noexcept {
    switch (direction) {
        case SortDirection::kAscending:  return "ASC";
        case SortDirection::kDescending: return "DESC";
    }
    SMITHER_UNREACHABLE();
}

std::string IndexDef::to_sql() const {
    std::string sql = "CREATE INDEX " + name + " ON " + table.to_string() + " (";
    for (size_t i = 0; i < key_columns.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += key_columns[i].column;
        sql += " ";
        sql += to_string(key_columns[i].direction);
    }
    sql += ")";
    if (!storing_columns.empty()) {
        sql += " STORING (";
        for (size_t i = 0; i < storing_columns.size(); ++i) {
            if (i > 0) sql += ", ";
            sql += storing_columns[i];
        }
        sql += ")";
    }
    return sql;
}

std::string TableIndexName::to_string() const {
    return table.to_string() + "@" + index;
}

}  // namespace smither
