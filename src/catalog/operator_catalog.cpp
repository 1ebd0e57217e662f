/**
 * @file operator_catalog.cpp
 * @brief OperatorCatalog implementation
 */

#include "catalog/operator_catalog.hpp"

#include "common/logger.hpp"

namespace smither {

OperatorCatalog OperatorCatalog::build(const sem::Registry& registry) {
    OperatorCatalog catalog;
    for (const auto& [op, overloads] : registry.binary_operators()) {
        for (const auto& overload : overloads) {
            catalog.by_return_type_[overload.return_type.oid()].push_back(
                OperatorEntry{op, &overload});
            ++catalog.size_;
        }
    }
    LOG_INFO("Operator catalog: {} overload(s) across {} return type(s)",
             catalog.size_, catalog.by_return_type_.size());
    return catalog;
}

const std::vector<OperatorEntry>& OperatorCatalog::returning(oid_t return_oid) const {
    static const std::vector<OperatorEntry> kEmpty;
    auto it = by_return_type_.find(return_oid);
    return it != by_return_type_.end() ? it->second : kEmpty;
}

}  // namespace smither
