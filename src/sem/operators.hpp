#pragma once

/**
 * @file operators.hpp
 * @brief Binary operator overloads
 */

#include <cstdint>
#include <string_view>

#include "sem/types.hpp"

namespace smither::sem {

/**
 * @brief Infix binary operators
 */
enum class BinaryOperator : uint8_t {
    kBitand,
    kBitor,
    kBitxor,
    kPlus,
    kMinus,
    kMult,
    kDiv,
    kFloorDiv,
    kMod,
    kPow,
    kConcat,
    kLShift,
    kRShift,
    kJSONFetchVal,
    kJSONFetchText,
    kJSONFetchValPath,
    kJSONFetchTextPath,
};

/// SQL spelling of the operator ("+", "||", "->>", ...)
[[nodiscard]] std::string_view to_string(BinaryOperator op) noexcept;

/**
 * @brief One concrete signature of a binary operator
 */
struct BinOp {
    Type left_type;
    Type right_type;
    Type return_type;
};

}  // namespace smither::sem
