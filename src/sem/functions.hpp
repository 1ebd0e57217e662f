#pragma once

/**
 * @file functions.hpp
 * @brief Builtin function definitions and overloads
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sem/types.hpp"

namespace smither::sem {

/**
 * @brief How a function may appear in a statement
 */
enum class FunctionClass : uint8_t {
    kNormal,
    kAggregate,
    kWindow,
    kGenerator,
};

[[nodiscard]] std::string_view to_string(FunctionClass function_class) noexcept;

/**
 * @brief One concrete signature of a function
 */
struct Overload {
    std::vector<Type> arg_types;

    /// Return type, or nullopt when it is derived from the arguments
    std::optional<Type> return_type;

    /// Documentation string
    std::string info;

    /**
     * @brief Return type known without looking at the arguments
     * @return types::Unknown for overloads with a derived return type
     */
    [[nodiscard]] Type fixed_return_type() const noexcept {
        return return_type.value_or(types::Unknown);
    }
};

/**
 * @brief A named function and all its overloads
 */
struct FunctionDefinition {
    std::string name;
    FunctionClass function_class = FunctionClass::kNormal;
    std::string category;
    bool is_private = false;  ///< Not meant to be called by users
    std::vector<Overload> overloads;
};

}  // namespace smither::sem
