/**
 * @file registry.cpp
 * @brief Registry implementation
 */

#include "sem/registry.hpp"

#include <utility>

namespace smither::sem {

void Registry::add_binary_operator(BinaryOperator op, BinOp overload) {
    binary_operators_[op].push_back(overload);
}

void Registry::add_function(FunctionDefinition definition) {
    functions_.push_back(std::move(definition));
}

size_t Registry::binary_overload_count() const noexcept {
    size_t count = 0;
    for (const auto& [op, overloads] : binary_operators_) {
        count += overloads.size();
    }
    return count;
}

size_t Registry::function_overload_count() const noexcept {
    size_t count = 0;
    for (const auto& def : functions_) {
        count += def.overloads.size();
    }
    return count;
}

}  // namespace smither::sem
