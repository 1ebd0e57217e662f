/**
 * @file functions.cpp
 * @brief Function class names
 */

#include "sem/functions.hpp"

#include "common/macros.hpp"

namespace smither::sem {

std::string_view to_string(FunctionClass function_class) noexcept {
    switch (function_class) {
        case FunctionClass::kNormal:    return "normal";
        case FunctionClass::kAggregate: return "aggregate";
        case FunctionClass::kWindow:    return "window";
        case FunctionClass::kGenerator: return "generator";
    }
    SMITHER_UNREACHABLE();
}

}  // namespace smither::sem
