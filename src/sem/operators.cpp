/**
 * @file operators.cpp
 * @brief Binary operator spellings
 */

#include "sem/operators.hpp"

#include "common/macros.hpp"

namespace smither::sem {

std::string_view to_string(BinaryOperator op) noexcept {
    switch (op) {
        case BinaryOperator::kBitand:            return "&";
        case BinaryOperator::kBitor:             return "|";
        case BinaryOperator::kBitxor:            return "#";
        case BinaryOperator::kPlus:              return "+";
        case BinaryOperator::kMinus:             return "-";
        case BinaryOperator::kMult:              return "*";
        case BinaryOperator::kDiv:               return "/";
        case BinaryOperator::kFloorDiv:          return "//";
        case BinaryOperator::kMod:               return "%";
        case BinaryOperator::kPow:               return "^";
        case BinaryOperator::kConcat:            return "||";
        case BinaryOperator::kLShift:            return "<<";
        case BinaryOperator::kRShift:            return ">>";
        case BinaryOperator::kJSONFetchVal:      return "->";
        case BinaryOperator::kJSONFetchText:     return "->>";
        case BinaryOperator::kJSONFetchValPath:  return "#>";
        case BinaryOperator::kJSONFetchTextPath: return "#>>";
    }
    SMITHER_UNREACHABLE();
}

}  // namespace smither::sem
