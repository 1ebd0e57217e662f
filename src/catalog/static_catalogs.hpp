#pragma once

/**
 * @file static_catalogs.hpp
 * @brief The operator and function catalogs built once at start-up
 */

#include <memory>

#include "catalog/function_catalog.hpp"
#include "catalog/operator_catalog.hpp"
#include "sem/registry.hpp"

namespace smither {

/**
 * @brief Immutable pair of catalogs sharing ownership of their registry
 *
 * Build once before any generation thread starts and hand out the
 * shared_ptr; readers never lock.
 *
 * @code
 * auto registry = std::make_shared<const sem::Registry>(sem::Registry::with_builtins());
 * auto catalogs = StaticCatalogs::build(registry);
 * for (const auto& entry : catalogs->operators().returning(sem::types::Int.oid())) { ... }
 * @endcode
 */
class StaticCatalogs {
    /// Restricts construction to build() while keeping make_shared usable
    struct BuildKey {
        explicit BuildKey() = default;
    };

public:
    [[nodiscard]] static std::shared_ptr<const StaticCatalogs> build(
        std::shared_ptr<const sem::Registry> registry);

    [[nodiscard]] const OperatorCatalog& operators() const noexcept { return operators_; }
    [[nodiscard]] const FunctionCatalog& functions() const noexcept { return functions_; }
    [[nodiscard]] const sem::Registry& registry() const noexcept { return *registry_; }

    StaticCatalogs(BuildKey key, std::shared_ptr<const sem::Registry> registry,
                   OperatorCatalog operators, FunctionCatalog functions);

private:
    std::shared_ptr<const sem::Registry> registry_;
    OperatorCatalog operators_;
    FunctionCatalog functions_;
};

}  // namespace smither
