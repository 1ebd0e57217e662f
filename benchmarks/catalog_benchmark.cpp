/**
 * @file catalog_benchmark.cpp
 * @brief Benchmarks for static catalog construction and lookup
 */

#include <benchmark/benchmark.h>

#include <memory>

#include "catalog/static_catalogs.hpp"
#include "common/logger.hpp"

namespace {

using namespace smither;

void quiet_logging() {
    Logger::set_level(spdlog::level::off);
}

static void BM_BuildBuiltinRegistry(benchmark::State &state) {
    for (auto _ : state) {
        auto registry = sem::Registry::with_builtins();
        benchmark::DoNotOptimize(registry.function_overload_count());
    }
}

BENCHMARK(BM_BuildBuiltinRegistry);

static void BM_BuildStaticCatalogs(benchmark::State &state) {
    quiet_logging();
    auto registry = std::make_shared<const sem::Registry>(sem::Registry::with_builtins());

    for (auto _ : state) {
        auto catalogs = StaticCatalogs::build(registry);
        benchmark::DoNotOptimize(catalogs->functions().size());
    }

    state.SetItemsProcessed(state.iterations() *
                            static_cast<int64_t>(registry->function_overload_count() +
                                                 registry->binary_overload_count()));
}

BENCHMARK(BM_BuildStaticCatalogs);

static void BM_LookupByReturnType(benchmark::State &state) {
    quiet_logging();
    auto catalogs = StaticCatalogs::build(
        std::make_shared<const sem::Registry>(sem::Registry::with_builtins()));

    size_t i = 0;
    for (auto _ : state) {
        const auto &type = sem::types::kAnyNonArray[i++ % sem::types::kAnyNonArray.size()];
        benchmark::DoNotOptimize(catalogs->operators().returning(type.oid()).size());
        benchmark::DoNotOptimize(
            catalogs->functions().returning(sem::FunctionClass::kNormal, type.oid()).size());
    }

    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_LookupByReturnType);

}  // namespace
