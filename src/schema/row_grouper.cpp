/**
 * @file row_grouper.cpp
 * @brief RowGrouper implementation
 */

#include "schema/row_grouper.hpp"

#include <utility>

#include "common/logger.hpp"
#include "common/status.hpp"
#include "sem/types.hpp"

namespace smither {

RowGrouper::RowGrouper(std::string target_schema, sem::TypeResolver resolver)
    : target_schema_(std::move(target_schema)), resolver_(resolver) {}

bool RowGrouper::same_group(const ColumnRow& row) const noexcept {
    return row.catalog == last_catalog_ && row.schema == last_schema_ &&
           row.table == last_table_;
}

void RowGrouper::emit() {
    if (last_schema_ != target_schema_) {
        return;
    }
    tables_.emplace_back(TableName(last_catalog_, last_table_), std::move(pending_));
}

Status RowGrouper::add(const ColumnRow& row) {
    if (row.hidden) {
        LOG_TRACE("Skipping hidden column {}.{}", row.table, row.column);
        return Status::Ok();
    }

    if (!first_ && !same_group(row)) {
        emit();
        pending_.clear();
    }
    first_ = false;
    last_catalog_ = row.catalog;
    last_schema_ = row.schema;
    last_table_ = row.table;

    if (row.schema != target_schema_) {
        return Status::Ok();
    }

    sem::Type type;
    SMITHER_RETURN_IF_ERROR(resolver_(row.type_name, &type));
    pending_.emplace_back(row.column, type, row.nullable, row.computed);
    return Status::Ok();
}

std::vector<TableRef> RowGrouper::finish() {
    if (!first_) {
        emit();
    }
    std::vector<TableRef> tables = std::move(tables_);
    tables_.clear();
    pending_.clear();
    first_ = true;
    last_catalog_.clear();
    last_schema_.clear();
    last_table_.clear();
    return tables;
}

Status group_column_rows(const std::vector<ColumnRow>& rows,
                         std::string_view target_schema,
                         std::vector<TableRef>* out,
                         sem::TypeResolver resolver) {
    RowGrouper grouper{std::string(target_schema), resolver};
    for (const auto& row : rows) {
        SMITHER_RETURN_IF_ERROR(grouper.add(row));
    }
    *out = grouper.finish();
    return Status::Ok();
}

}  // namespace smither
