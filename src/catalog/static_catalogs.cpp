/**
 * @file static_catalogs.cpp
 * @brief StaticCatalogs implementation
 */

#include "catalog/static_catalogs.hpp"

#include <utility>

namespace smither {

StaticCatalogs::StaticCatalogs(BuildKey /*key*/, std::shared_ptr<const sem::Registry> registry,
                               OperatorCatalog operators, FunctionCatalog functions)
    : registry_(std::move(registry)),
      operators_(std::move(operators)),
      functions_(std::move(functions)) {}

std::shared_ptr<const StaticCatalogs> StaticCatalogs::build(
    std::shared_ptr<const sem::Registry> registry) {
    OperatorCatalog operators = OperatorCatalog::build(*registry);
    FunctionCatalog functions = FunctionCatalog::build(*registry);
    return std::make_shared<const StaticCatalogs>(BuildKey{}, std::move(registry),
                                                  std::move(operators), std::move(functions));
}

}  // namespace smither
