#pragma once

/**
 * @file table.hpp
 * @brief Discovered tables and their qualified names
 */

#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "schema/column.hpp"

namespace smither {

/**
 * @brief Qualified table identifier (catalog + table name)
 */
struct TableName {
    std::string catalog;
    std::string name;

    TableName() = default;
    TableName(std::string c, std::string n) : catalog(std::move(c)), name(std::move(n)) {}

    /// "catalog.name", or just "name" when the catalog is empty
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TableName& other) const noexcept {
        return catalog == other.catalog && name == other.name;
    }

    bool operator!=(const TableName& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const TableName& other) const noexcept {
        if (catalog != other.catalog) return catalog < other.catalog;
        return name < other.name;
    }
};

/**
 * @brief A table of the target schema and its visible columns
 */
class TableRef {
public:
    TableRef() = default;
    TableRef(TableName name, std::vector<ColumnDef> columns);

    [[nodiscard]] const TableName& name() const noexcept { return name_; }

    /// Columns in declaration order
    [[nodiscard]] const std::vector<ColumnDef>& columns() const noexcept {
        return columns_;
    }

    [[nodiscard]] size_t column_count() const noexcept {
        return columns_.size();
    }

    [[nodiscard]] const ColumnDef& column(size_t idx) const {
        return columns_.at(idx);
    }

    /// Get column index by name, returns -1 if not found
    [[nodiscard]] int get_column_index(const std::string& name) const;

    bool operator==(const TableRef& other) const noexcept {
        return name_ == other.name_ && columns_ == other.columns_;
    }

private:
    TableName name_;
    std::vector<ColumnDef> columns_;
};

}  // namespace smither

// Hash support for TableName
namespace std {
template <>
struct hash<smither::TableName> {
    size_t operator()(const smither::TableName& t) const noexcept {
        size_t h = hash<string>{}(t.catalog);
        return h ^ (hash<string>{}(t.name) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
}  // namespace std
