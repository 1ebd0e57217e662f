/**
 * @file function_catalog.cpp
 * @brief FunctionCatalog implementation
 */

#include "catalog/function_catalog.hpp"

#include "common/config.hpp"
#include "common/logger.hpp"

namespace smither {

bool is_excluded_definition(const sem::FunctionDefinition& definition) {
    if (definition.name == config::kSleepFunctionName) {
        return true;
    }
    if (definition.name.find(config::kForceFunctionMarker) != std::string::npos) {
        return true;
    }
    if (definition.category == config::kCompatibilityCategory) {
        return true;
    }
    return definition.is_private;
}

bool is_excluded_overload(const sem::Overload& overload) {
    if (overload.info.find(config::kUnusableOverloadMarker) != std::string::npos) {
        return true;
    }
    return !sem::is_non_array_family(overload.fixed_return_type());
}

FunctionCatalog FunctionCatalog::build(const sem::Registry& registry) {
    FunctionCatalog catalog;
    size_t skipped_definitions = 0;
    size_t skipped_overloads = 0;

    for (const auto& def : registry.functions()) {
        if (is_excluded_definition(def)) {
            LOG_TRACE("Function catalog: skipping {}", def.name);
            ++skipped_definitions;
            continue;
        }
        for (const auto& overload : def.overloads) {
            if (is_excluded_overload(overload)) {
                ++skipped_overloads;
                continue;
            }
            const oid_t ret = overload.fixed_return_type().oid();
            catalog.by_class_[def.function_class][ret].push_back(
                FunctionEntry{&def, &overload});
            ++catalog.size_;
        }
    }

    LOG_INFO("Function catalog: {} overload(s) kept, {} definition(s) and {} overload(s) skipped",
             catalog.size_, skipped_definitions, skipped_overloads);
    return catalog;
}

const std::vector<FunctionEntry>& FunctionCatalog::returning(sem::FunctionClass function_class,
                                                             oid_t return_oid) const {
    static const std::vector<FunctionEntry> kEmpty;
    auto cls = by_class_.find(function_class);
    if (cls == by_class_.end()) {
        return kEmpty;
    }
    auto it = cls->second.find(return_oid);
    return it != cls->second.end() ? it->second : kEmpty;
}

}  // namespace smither
