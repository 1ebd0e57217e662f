#pragma once

/**
 * @file column.hpp
 * @brief Column metadata of a discovered table
 */

#include <string>

#include "sem/types.hpp"

namespace smither {

/**
 * @brief Column definition as reported by introspection
 */
class ColumnDef {
public:
    ColumnDef(std::string name, sem::Type type, bool nullable = false,
              bool computed = false);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const sem::Type& type() const noexcept { return type_; }
    [[nodiscard]] bool is_nullable() const noexcept { return nullable_; }

    /// True if the column is derived from a generation expression
    [[nodiscard]] bool is_computed() const noexcept { return computed_; }

    bool operator==(const ColumnDef& other) const noexcept {
        return name_ == other.name_ && type_ == other.type_ &&
               nullable_ == other.nullable_ && computed_ == other.computed_;
    }

private:
    std::string name_;
    sem::Type type_;
    bool nullable_ = false;
    bool computed_ = false;
};

}  // namespace smither
