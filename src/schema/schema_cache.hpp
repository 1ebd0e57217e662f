#pragma once

/**
 * @file schema_cache.hpp
 * @brief Thread-safe holder of the discovered tables and indexes
 *
 * The cache is the only mutable schema state shared by generation threads:
 * - refresh() reloads everything from the connection under an exclusive lock
 *   and replaces the previous generation only if every query succeeded
 * - the pick and lookup operations take a shared lock and return copies
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "common/macros.hpp"
#include "schema/index.hpp"
#include "schema/introspection.hpp"
#include "schema/table.hpp"
#include "smither/connection.hpp"
#include "smither/status.hpp"

namespace smither {

/**
 * @brief Options for a SchemaCache
 */
struct SchemaCacheOptions {
    /// Introspection dialect of the connected engine
    DialectKind dialect = DialectKind::kCockroach;

    /// Schema to discover; empty selects the dialect's default
    std::string target_schema;

    /// Seed of the random engine behind the pick operations
    uint64_t seed = config::kDefaultSeed;
};

/**
 * @brief Outcome of an index pick
 */
enum class PickOutcome : uint8_t {
    kFound,
    kNoTables,   ///< The cache holds no tables
    kNoIndexes,  ///< The chosen table has no indexes
};

struct IndexPick {
    PickOutcome outcome = PickOutcome::kNoTables;
    TableIndexName name;
    IndexDef index;

    [[nodiscard]] bool found() const noexcept { return outcome == PickOutcome::kFound; }
};

class SchemaCache {
public:
    /**
     * @brief Create an empty cache
     * @param connection Used only by refresh(); nullptr runs schema-less
     */
    explicit SchemaCache(std::shared_ptr<Connection> connection = nullptr,
                         SchemaCacheOptions options = {});
    ~SchemaCache() = default;

    SMITHER_DISALLOW_COPY_AND_MOVE(SchemaCache);

    /**
     * @brief Reload tables and indexes from the connection
     *
     * Without a connection this is a no-op returning Ok. On failure the
     * cache keeps its previous tables and indexes and the error is returned
     * unchanged.
     */
    [[nodiscard]] Status refresh();

    /**
     * @brief A uniformly chosen table, or nullopt when there are none
     */
    [[nodiscard]] std::optional<TableRef> pick_random_table();

    /**
     * @brief The indexes of @p table; empty if it has none or is unknown
     */
    [[nodiscard]] IndexMap indexes_for(const TableName& table) const;

    /**
     * @brief A random index of a random table
     *
     * Yields kNoTables when the cache is empty and kNoIndexes when the chosen
     * table has none; callers may retry for a different table.
     */
    [[nodiscard]] IndexPick pick_random_index();

    /**
     * @brief A uniformly chosen index of @p table
     */
    [[nodiscard]] IndexPick pick_random_index_on(const TableName& table);

    /// Snapshot of the current tables
    [[nodiscard]] std::vector<TableRef> tables() const;

    [[nodiscard]] size_t table_count() const;

    [[nodiscard]] bool has_connection() const noexcept { return connection_ != nullptr; }

    [[nodiscard]] const std::string& target_schema() const noexcept { return target_schema_; }

private:
    [[nodiscard]] Status load_tables(std::vector<TableRef>* out);

    /// Requires mutex_ held (shared or exclusive)
    [[nodiscard]] size_t draw(size_t n);

    /// Requires mutex_ held (shared or exclusive)
    [[nodiscard]] IndexPick pick_index_locked(const TableName& table);

    std::shared_ptr<Connection> connection_;
    std::unique_ptr<Dialect> dialect_;
    std::string target_schema_;

    mutable std::shared_mutex mutex_;  /// Guards tables_, indexes_ and rng_
    std::vector<TableRef> tables_;
    IndexCatalog indexes_;

    std::mutex rng_mutex_;  /// Serializes draws among shared-lock holders
    std::mt19937_64 rng_;
};

}  // namespace smither
