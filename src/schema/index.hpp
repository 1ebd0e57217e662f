#pragma once

/**
 * @file index.hpp
 * @brief Index definitions discovered on a table
 */

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "schema/table.hpp"

namespace smither {

enum class SortDirection : uint8_t {
    kAscending,
    kDescending,
};

[[nodiscard]] std::string_view to_string(SortDirection direction) noexcept;

/**
 * @brief One key column of an index
 */
struct IndexElem {
    std::string column;
    SortDirection direction = SortDirection::kAscending;

    bool operator==(const IndexElem& other) const noexcept {
        return column == other.column && direction == other.direction;
    }
};

/**
 * @brief An index on one table
 *
 * Key columns keep the order in which the engine reported them. Storing
 * columns are carried in the index payload but take no part in its ordering.
 */
struct IndexDef {
    std::string name;
    TableName table;
    std::vector<IndexElem> key_columns;
    std::vector<std::string> storing_columns;

    IndexDef() = default;
    IndexDef(std::string n, TableName t) : name(std::move(n)), table(std::move(t)) {}

    /// "CREATE INDEX name ON table (a ASC, b DESC) STORING (c)"
    [[nodiscard]] std::string to_sql() const;

    bool operator==(const IndexDef& other) const noexcept {
        return name == other.name && table == other.table &&
               key_columns == other.key_columns &&
               storing_columns == other.storing_columns;
    }
};

/**
 * @brief Reference to an index by its table and name
 */
struct TableIndexName {
    TableName table;
    std::string index;

    /// "table@index"
    [[nodiscard]] std::string to_string() const;
};

/// Index name -> definition for one table, ordered by name
using IndexMap = std::map<std::string, IndexDef>;

/// Table -> its indexes
using IndexCatalog = std::unordered_map<TableName, IndexMap>;

}  // namespace smither
