/**
 * @file index_assembler.cpp
 * @brief IndexAssembler implementation
 */

#include "schema/index_assembler.hpp"

#include <utility>

#include "common/logger.hpp"
#include "common/status.hpp"

namespace smither {

IndexAssembler::IndexAssembler(TableName table) : table_(std::move(table)) {}

void IndexAssembler::add(const IndexRow& row) {
    ++rows_seen_;
    auto it = indexes_.find(row.index);
    if (it == indexes_.end()) {
        it = indexes_.emplace(row.index, IndexDef(row.index, table_)).first;
    }
    IndexDef& index = it->second;
    if (row.storing) {
        index.storing_columns.push_back(row.column);
        return;
    }
    index.key_columns.push_back(IndexElem{
        row.column,
        row.ascending ? SortDirection::kAscending : SortDirection::kDescending,
    });
}

IndexMap IndexAssembler::finish() {
    IndexMap indexes = std::move(indexes_);
    indexes_.clear();
    rows_seen_ = 0;
    return indexes;
}

Status assemble_indexes(Connection& connection, const Dialect& dialect,
                        std::string_view schema,
                        const std::vector<TableRef>& tables,
                        IndexCatalog* out) {
    IndexCatalog catalog;
    catalog.reserve(tables.size());

    for (const auto& table : tables) {
        Result result = connection.query(dialect.indexes_query(table.name(), schema));
        if (!result.ok()) {
            LOG_ERROR("Index query for {} failed: {}", table.name().to_string(),
                      result.status().to_string());
            return result.status();
        }

        IndexAssembler assembler(table.name());
        for (const auto& row : result) {
            IndexRow index_row;
            SMITHER_RETURN_IF_ERROR(decode_index_row(row, &index_row));
            assembler.add(index_row);
        }
        const size_t rows = assembler.rows_seen();
        IndexMap indexes = assembler.finish();
        LOG_DEBUG("Table {}: {} index(es) from {} row(s)", table.name().to_string(),
                  indexes.size(), rows);
        catalog[table.name()] = std::move(indexes);
    }

    *out = std::move(catalog);
    return Status::Ok();
}

}  // namespace smither
