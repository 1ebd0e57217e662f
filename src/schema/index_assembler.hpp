#pragma once

/**
 * @file index_assembler.hpp
 * @brief Folds index-metadata rows into index definitions
 */

#include <string_view>
#include <vector>

#include "schema/index.hpp"
#include "schema/introspection.hpp"
#include "smither/connection.hpp"
#include "smither/status.hpp"

namespace smither {

/**
 * @brief Builds the IndexMap of a single table
 *
 * The first row naming an index creates its definition. A storing row
 * appends to the storing columns; any other row appends a key column whose
 * direction is taken from the ascending flag.
 */
class IndexAssembler {
public:
    explicit IndexAssembler(TableName table);

    void add(const IndexRow& row);

    [[nodiscard]] size_t rows_seen() const noexcept { return rows_seen_; }

    /// Take the assembled indexes; the assembler is left empty
    [[nodiscard]] IndexMap finish();

private:
    TableName table_;
    IndexMap indexes_;
    size_t rows_seen_ = 0;
};

/**
 * @brief Query and assemble the indexes of every table
 *
 * Every table whose query succeeds gets an entry, empty if it has no
 * indexes. The first failing query or undecodable row aborts the whole
 * assembly and @p out is left untouched.
 */
[[nodiscard]] Status assemble_indexes(Connection& connection, const Dialect& dialect,
                                      std::string_view schema,
                                      const std::vector<TableRef>& tables,
                                      IndexCatalog* out);

}  // namespace smither
