#pragma once

/**
 * @file function_catalog.hpp
 * @brief Function overloads indexed by class and return type
 */

#include <map>
#include <vector>

#include "common/types.hpp"
#include "sem/registry.hpp"

namespace smither {

/**
 * @brief One function overload
 *
 * Both pointers refer into the Registry the catalog was built from.
 */
struct FunctionEntry {
    const sem::FunctionDefinition* definition;
    const sem::Overload* overload;
};

/**
 * @brief Function overloads usable in generated statements
 *
 * Built from the registry by dropping, in order:
 * - definitions named pg_sleep or containing "crdb_internal.force_"
 * - definitions in the "Compatibility" category
 * - private definitions
 * - overloads whose info says "Not usable"
 * - overloads whose fixed return type is not a non-array type (this also
 *   drops overloads whose return type depends on their arguments)
 *
 * Immutable after build().
 */
class FunctionCatalog {
public:
    using ByReturnType = std::map<oid_t, std::vector<FunctionEntry>>;
    using ByClass = std::map<sem::FunctionClass, ByReturnType>;

    /**
     * @brief Build the catalog
     * @param registry Must outlive the catalog
     */
    [[nodiscard]] static FunctionCatalog build(const sem::Registry& registry);

    /// Overloads of @p function_class producing @p return_oid
    [[nodiscard]] const std::vector<FunctionEntry>& returning(sem::FunctionClass function_class,
                                                              oid_t return_oid) const;

    [[nodiscard]] const ByClass& by_class() const noexcept { return by_class_; }

    /// Total number of overloads kept
    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    FunctionCatalog() = default;

    ByClass by_class_;
    size_t size_ = 0;
};

/**
 * @brief Whether a whole definition is excluded from generation
 */
[[nodiscard]] bool is_excluded_definition(const sem::FunctionDefinition& definition);

/**
 * @brief Whether a single overload is excluded from generation
 */
[[nodiscard]] bool is_excluded_overload(const sem::Overload& overload);

}  // namespace smither
