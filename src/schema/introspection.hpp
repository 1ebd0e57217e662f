#pragma once

/**
 * @file introspection.hpp
 * @brief Introspection queries and the rows they produce
 *
 * Schema discovery issues two kinds of queries: one listing every column of
 * every table, ordered by (catalog, schema, table), and one per table listing
 * the columns of each of its indexes. A Dialect supplies the SQL text for a
 * given engine; every dialect yields rows of the same shape, decoded here.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "schema/table.hpp"
#include "sem/types.hpp"
#include "smither/result.hpp"
#include "smither/status.hpp"

namespace smither {

// ─────────────────────────────────────────────────────────────────────────────
// Row shapes
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief One row of the column-metadata query
 */
struct ColumnRow {
    std::string catalog;
    std::string schema;
    std::string table;
    std::string column;
    std::string type_name;
    bool computed = false;
    bool nullable = false;
    bool hidden = false;
};

/**
 * @brief One row of the per-table index-metadata query
 */
struct IndexRow {
    std::string index;
    std::string column;
    bool storing = false;
    bool ascending = true;
};

/// Number of values in a column-metadata row
constexpr size_t kColumnRowWidth = 8;

/// Number of values in an index-metadata row
constexpr size_t kIndexRowWidth = 4;

/**
 * @brief Decode a column-metadata row
 * @return Status::Corruption if the row has the wrong arity or a value has
 * the wrong shape
 */
[[nodiscard]] Status decode_column_row(const Row& row, ColumnRow* out);

/**
 * @brief Decode an index-metadata row
 * @return Status::Corruption on arity or shape mismatch
 */
[[nodiscard]] Status decode_index_row(const Row& row, IndexRow* out);

// ─────────────────────────────────────────────────────────────────────────────
// Dialects
// ─────────────────────────────────────────────────────────────────────────────

enum class DialectKind : uint8_t {
    kCockroach,
    kSqlite,
};

[[nodiscard]] std::string_view to_string(DialectKind kind) noexcept;

/**
 * @brief Parse "cockroach" / "sqlite" (case-insensitive)
 * @return Status::InvalidArgument for any other name
 */
[[nodiscard]] Status parse_dialect(std::string_view name, DialectKind* out);

/**
 * @brief SQL text of the introspection queries for one engine
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    [[nodiscard]] virtual DialectKind kind() const noexcept = 0;

    /// Schema used when the caller does not configure one
    [[nodiscard]] virtual std::string_view default_schema() const noexcept = 0;

    /**
     * @brief Query listing (catalog, schema, table, column, type, computed,
     * nullable, hidden), ordered by catalog, schema and table, with columns
     * of one table in declaration order
     */
    [[nodiscard]] virtual std::string columns_query(std::string_view schema) const = 0;

    /**
     * @brief Query listing (index, column, storing, ascending) for one table
     */
    [[nodiscard]] virtual std::string indexes_query(const TableName& table,
                                                    std::string_view schema) const = 0;

    /// How the type names of the columns query map to semantic types
    [[nodiscard]] virtual sem::TypeResolver type_resolver() const noexcept = 0;
};

[[nodiscard]] std::unique_ptr<Dialect> make_dialect(DialectKind kind);

/// Quote a string as an SQL literal, doubling embedded quotes
[[nodiscard]] std::string quote_literal(std::string_view value);

/// Quote an SQL identifier, doubling embedded double quotes
[[nodiscard]] std::string quote_identifier(std::string_view name);

}  // namespace smither
