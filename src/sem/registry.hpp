#pragma once

/**
 * @file registry.hpp
 * @brief Registry of binary operator and function signatures
 *
 * The registry is the read-only source the operator and function catalogs
 * are derived from. It is populated once, either with the builtin set of the
 * engine under test or, in tests, with hand-picked definitions.
 */

#include <map>
#include <vector>

#include "sem/functions.hpp"
#include "sem/operators.hpp"

namespace smither::sem {

class Registry {
public:
    using BinOpMap = std::map<BinaryOperator, std::vector<BinOp>>;

    Registry() = default;

    /**
     * @brief Build a registry holding the engine's builtin operators and
     * functions
     */
    [[nodiscard]] static Registry with_builtins();

    void add_binary_operator(BinaryOperator op, BinOp overload);

    void add_function(FunctionDefinition definition);

    [[nodiscard]] const BinOpMap& binary_operators() const noexcept {
        return binary_operators_;
    }

    /// Function definitions in registration order
    [[nodiscard]] const std::vector<FunctionDefinition>& functions() const noexcept {
        return functions_;
    }

    [[nodiscard]] size_t binary_overload_count() const noexcept;
    [[nodiscard]] size_t function_overload_count() const noexcept;

private:
    BinOpMap binary_operators_;
    std::vector<FunctionDefinition> functions_;
};

}  // namespace smither::sem
