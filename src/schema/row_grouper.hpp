#pragma once

/**
 * @file row_grouper.hpp
 * @brief Groups an ordered column-metadata stream into tables
 */

#include <string>
#include <string_view>
#include <vector>

#include "schema/introspection.hpp"
#include "schema/table.hpp"
#include "sem/types.hpp"
#include "smither/status.hpp"

namespace smither {

/**
 * @brief Run-length grouping of column rows by (catalog, schema, table)
 *
 * Rows must arrive ordered by (catalog, schema, table). Hidden rows are
 * dropped before grouping, so a table whose columns are all hidden never
 * forms a group and is not emitted. Groups outside the target schema are
 * tracked for boundary detection but never materialized, and their type
 * names are not resolved. Type names of retained rows go through the
 * resolver, sem::type_from_name unless the caller supplies another.
 *
 * Usage:
 * @code
 * RowGrouper grouper("public");
 * for (const auto& row : rows) {
 *     SMITHER_RETURN_IF_ERROR(grouper.add(row));
 * }
 * std::vector<TableRef> tables = grouper.finish();
 * @endcode
 */
class RowGrouper {
public:
    explicit RowGrouper(std::string target_schema,
                        sem::TypeResolver resolver = sem::type_from_name);

    /**
     * @brief Consume the next row
     * @return Status::Internal if the row's type name cannot be resolved
     */
    [[nodiscard]] Status add(const ColumnRow& row);

    /**
     * @brief Flush the pending group and return every emitted table
     *
     * The grouper is reset and may be reused afterwards.
     */
    [[nodiscard]] std::vector<TableRef> finish();

    [[nodiscard]] const std::string& target_schema() const noexcept {
        return target_schema_;
    }

private:
    void emit();
    [[nodiscard]] bool same_group(const ColumnRow& row) const noexcept;

    std::string target_schema_;
    sem::TypeResolver resolver_;
    bool first_ = true;
    std::string last_catalog_;
    std::string last_schema_;
    std::string last_table_;
    std::vector<ColumnDef> pending_;
    std::vector<TableRef> tables_;
};

/**
 * @brief Group a complete row sequence
 * @param rows Rows ordered by (catalog, schema, table)
 * @param target_schema Only tables of this schema are produced
 * @param out Receives the tables in input order
 * @param resolver Maps type names to semantic types
 */
[[nodiscard]] Status group_column_rows(const std::vector<ColumnRow>& rows,
                                       std::string_view target_schema,
                                       std::vector<TableRef>* out,
                                       sem::TypeResolver resolver = sem::type_from_name);

}  // namespace smither
