/**
 * @file column.cpp
 * @brief ColumnDef implementation
 */

#include "schema/column.hpp"

#include <utility>

namespace smither {

ColumnDef::ColumnDef(std::string name, sem::Type type, bool nullable, bool computed)
    : name_(std::move(name)), type_(type), nullable_(nullable), computed_(computed) {}

}  // namespace smither
