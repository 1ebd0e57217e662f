/**
 * @file schema_cache_benchmark.cpp
 * @brief Benchmarks for schema refresh and random picks
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <memory>
#include <string>

#include "bench_utils.hpp"
#include "common/logger.hpp"
#include "schema/schema_cache.hpp"

namespace {

using namespace smither;

void SkipWithStatus(benchmark::State &state, const Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

std::shared_ptr<SqliteConnection> open_with_schema(benchmark::State &state,
                                                   const std::string &path,
                                                   int64_t tables) {
    std::shared_ptr<SqliteConnection> conn;
    auto status = SqliteConnection::open(path, &conn);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return nullptr;
    }
    status = bench::create_schema(*conn, tables);
    if (!status.ok()) {
        SkipWithStatus(state, status);
        return nullptr;
    }
    return conn;
}

SchemaCacheOptions sqlite_options() {
    SchemaCacheOptions options;
    options.dialect = DialectKind::kSqlite;
    return options;
}

static void BM_SchemaCache_Refresh(benchmark::State &state) {
    Logger::set_level(spdlog::level::off);
    const int64_t tables = state.range(0);

    bench::TempDbFile db_file("smither_refresh");
    auto conn = open_with_schema(state, db_file.path(), tables);
    if (conn == nullptr) {
        return;
    }
    SchemaCache cache(conn, sqlite_options());

    for (auto _ : state) {
        auto status = cache.refresh();
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(cache.table_count());
    }

    state.SetItemsProcessed(state.iterations() * tables);
}

BENCHMARK(BM_SchemaCache_Refresh)->Arg(10)->Arg(100);

// Shared across benchmark threads; set up by thread 0.
std::shared_ptr<SchemaCache> g_cache;

static void BM_SchemaCache_PickRandomIndex(benchmark::State &state) {
    if (state.thread_index() == 0) {
        Logger::set_level(spdlog::level::off);
        auto conn = open_with_schema(state, ":memory:", 50);
        if (conn != nullptr) {
            g_cache = std::make_shared<SchemaCache>(conn, sqlite_options());
            auto status = g_cache->refresh();
            if (!status.ok()) {
                SkipWithStatus(state, status);
            }
        }
    }

    for (auto _ : state) {
        if (g_cache == nullptr) {
            break;
        }
        IndexPick pick = g_cache->pick_random_index();
        benchmark::DoNotOptimize(pick.outcome);
    }

    if (state.thread_index() == 0) {
        g_cache.reset();
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(BM_SchemaCache_PickRandomIndex)->Threads(1)->Threads(4);

}  // namespace
