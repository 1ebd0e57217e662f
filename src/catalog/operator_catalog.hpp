#pragma once

/**
 * @file operator_catalog.hpp
 * @brief Binary operator overloads indexed by return type
 */

#include <map>
#include <vector>

#include "common/types.hpp"
#include "sem/registry.hpp"

namespace smither {

/**
 * @brief One binary operator overload
 *
 * @c overload points into the Registry the catalog was built from.
 */
struct OperatorEntry {
    sem::BinaryOperator op;
    const sem::BinOp* overload;
};

/**
 * @brief Every binary operator overload, keyed by return type OID
 *
 * An operator with several overloads appears once under each of their
 * return types. No overload is filtered out. Immutable after build(), so
 * concurrent readers need no synchronization.
 */
class OperatorCatalog {
public:
    using ByReturnType = std::map<oid_t, std::vector<OperatorEntry>>;

    /**
     * @brief Build the catalog
     * @param registry Must outlive the catalog
     */
    [[nodiscard]] static OperatorCatalog build(const sem::Registry& registry);

    /// Overloads producing @p return_oid; empty if there are none
    [[nodiscard]] const std::vector<OperatorEntry>& returning(oid_t return_oid) const;

    [[nodiscard]] const ByReturnType& by_return_type() const noexcept {
        return by_return_type_;
    }

    /// Total number of overloads
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    OperatorCatalog() = default;

    ByReturnType by_return_type_;
    size_t size_ = 0;
};

}  // namespace smither
