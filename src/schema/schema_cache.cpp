/**
 * @file schema_cache.cpp
 * @brief SchemaCache implementation
 */

#include "schema/schema_cache.hpp"

#include <cstddef>
#include <iterator>
#include <utility>

#include "common/logger.hpp"
#include "common/status.hpp"
#include "schema/index_assembler.hpp"
#include "schema/row_grouper.hpp"

namespace smither {

SchemaCache::SchemaCache(std::shared_ptr<Connection> connection, SchemaCacheOptions options)
    : connection_(std::move(connection)),
      dialect_(make_dialect(options.dialect)),
      target_schema_(options.target_schema.empty()
                         ? std::string(dialect_->default_schema())
                         : std::move(options.target_schema)),
      rng_(options.seed) {
    Logger::init();
}

// ─────────────────────────────────────────────────────────────────────────────
// Refresh
// ─────────────────────────────────────────────────────────────────────────────

Status SchemaCache::refresh() {
    if (connection_ == nullptr) {
        LOG_DEBUG("Schema refresh skipped: no connection");
        return Status::Ok();
    }

    std::unique_lock lock(mutex_);

    std::vector<TableRef> tables;
    SMITHER_RETURN_IF_ERROR(load_tables(&tables));

    IndexCatalog indexes;
    SMITHER_RETURN_IF_ERROR(
        assemble_indexes(*connection_, *dialect_, target_schema_, tables, &indexes));

    size_t index_count = 0;
    for (const auto& [table, table_indexes] : indexes) {
        index_count += table_indexes.size();
    }

    tables_ = std::move(tables);
    indexes_ = std::move(indexes);
    LOG_INFO("Schema refreshed ({} dialect, schema {}): {} table(s), {} index(es)",
             to_string(dialect_->kind()), target_schema_, tables_.size(), index_count);
    return Status::Ok();
}

Status SchemaCache::load_tables(std::vector<TableRef>* out) {
    Result result = connection_->query(dialect_->columns_query(target_schema_));
    if (!result.ok()) {
        LOG_ERROR("Column query failed: {}", result.status().to_string());
        return result.status();
    }

    RowGrouper grouper(target_schema_, dialect_->type_resolver());
    for (const auto& row : result) {
        ColumnRow column_row;
        SMITHER_RETURN_IF_ERROR(decode_column_row(row, &column_row));
        Status status = grouper.add(column_row);
        if (!status.ok()) {
            LOG_ERROR("Column {}.{}: {}", column_row.table, column_row.column,
                      status.to_string());
            return status;
        }
    }
    *out = grouper.finish();
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Reads
// ─────────────────────────────────────────────────────────────────────────────

size_t SchemaCache::draw(size_t n) {
    SMITHER_ASSERT(n > 0, "draw from an empty range");
    std::lock_guard guard(rng_mutex_);
    std::uniform_int_distribution<size_t> dist(0, n - 1);
    return dist(rng_);
}

std::optional<TableRef> SchemaCache::pick_random_table() {
    std::shared_lock lock(mutex_);
    if (tables_.empty()) {
        return std::nullopt;
    }
    return tables_[draw(tables_.size())];
}

IndexMap SchemaCache::indexes_for(const TableName& table) const {
    std::shared_lock lock(mutex_);
    auto it = indexes_.find(table);
    return it != indexes_.end() ? it->second : IndexMap{};
}

IndexPick SchemaCache::pick_index_locked(const TableName& table) {
    IndexPick pick;
    auto it = indexes_.find(table);
    if (it == indexes_.end() || it->second.empty()) {
        pick.outcome = PickOutcome::kNoIndexes;
        return pick;
    }
    auto chosen = std::next(it->second.begin(),
                            static_cast<std::ptrdiff_t>(draw(it->second.size())));
    pick.outcome = PickOutcome::kFound;
    pick.name = TableIndexName{table, chosen->first};
    pick.index = chosen->second;
    return pick;
}

IndexPick SchemaCache::pick_random_index() {
    std::shared_lock lock(mutex_);
    if (tables_.empty()) {
        return IndexPick{};
    }
    const TableRef& table = tables_[draw(tables_.size())];
    return pick_index_locked(table.name());
}

IndexPick SchemaCache::pick_random_index_on(const TableName& table) {
    std::shared_lock lock(mutex_);
    return pick_index_locked(table);
}

std::vector<TableRef> SchemaCache::tables() const {
    std::shared_lock lock(mutex_);
    return tables_;
}

size_t SchemaCache::table_count() const {
    std::shared_lock lock(mutex_);
    return tables_.size();
}

}  // namespace smither
