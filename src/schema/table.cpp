/**
 * @file table.cpp
 * @brief TableName and TableRef implementation
 */

#include "schema/table.hpp"

namespace smither {

std::string TableName::to_string() const {
    if (catalog.empty()) {
        return name;
    }
    return catalog + "." + name;
}

TableRef::TableRef(TableName name, std::vector<ColumnDef> columns)
    : name_(std::move(name)), columns_(std::move(columns)) {}

int TableRef::get_column_index(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i].name() == name) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

}  // namespace smither
