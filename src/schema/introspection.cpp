/**
 * @file introspection.cpp
 * @brief Introspection dialects and row decoding
 */

#include "schema/introspection.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "common/config.hpp"
#include "common/macros.hpp"
#include "common/status.hpp"

namespace smither {

namespace {

Status decode_string(const Row& row, size_t idx, std::string_view field, std::string* out) {
    auto v = row[idx].try_string();
    if (!v.has_value()) {
        return Status::Corruption("expected string for " + std::string(field) +
                                  ", got " + row[idx].to_string());
    }
    *out = std::string(*v);
    return Status::Ok();
}

Status decode_bool(const Row& row, size_t idx, std::string_view field, bool* out) {
    auto v = row[idx].try_bool();
    if (!v.has_value()) {
        return Status::Corruption("expected bool for " + std::string(field) +
                                  ", got " + row[idx].to_string());
    }
    *out = *v;
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// CockroachDB
// ─────────────────────────────────────────────────────────────────────────────

class CockroachDialect : public Dialect {
public:
    DialectKind kind() const noexcept override { return DialectKind::kCockroach; }

    std::string_view default_schema() const noexcept override {
        return config::kDefaultTargetSchema;
    }

    std::string columns_query(std::string_view schema) const override {
        return R"(
SELECT
	table_catalog,
	table_schema,
	table_name,
	column_name,
	crdb_sql_type,
	generation_expression != '' AS computed,
	is_nullable = 'YES' AS nullable,
	is_hidden = 'YES' AS hidden
FROM
	information_schema.columns
WHERE
	table_schema = )" + quote_literal(schema) + R"(
ORDER BY
	table_catalog, table_schema, table_name, ordinal_position
)";
    }

    std::string indexes_query(const TableName& table, std::string_view schema) const override {
        std::string name;
        if (!table.catalog.empty()) {
            name = quote_identifier(table.catalog) + ".";
        }
        name += quote_identifier(schema) + "." + quote_identifier(table.name);
        return "SELECT index_name, column_name, storing, direction = 'ASC' "
               "FROM [SHOW INDEXES FROM " + name + "]";
    }

    sem::TypeResolver type_resolver() const noexcept override {
        return sem::type_from_name;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// SQLite
// ─────────────────────────────────────────────────────────────────────────────

/**
 * table_xinfo reports hidden = 1 for hidden columns of virtual tables and
 * 2 or 3 for generated columns. index_xinfo reports key = 0 for the
 * auxiliary columns appended to every index entry; rowid shows up there with
 * a NULL name and is dropped.
 */
class SqliteDialect : public Dialect {
public:
    DialectKind kind() const noexcept override { return DialectKind::kSqlite; }

    std::string_view default_schema() const noexcept override {
        return config::kSqliteMainSchema;
    }

    std::string columns_query(std::string_view /*schema*/) const override {
        const std::string main = quote_literal(config::kSqliteMainSchema);
        return R"(
SELECT
	)" + main + R"( AS table_catalog,
	)" + main + R"( AS table_schema,
	m.name AS table_name,
	p.name AS column_name,
	CASE WHEN p.type = '' THEN 'BLOB' ELSE p.type END AS type_name,
	p.hidden IN (2, 3) AS computed,
	p."notnull" = 0 AS nullable,
	p.hidden = 1 AS hidden
FROM
	sqlite_master AS m, pragma_table_xinfo(m.name) AS p
WHERE
	m.type = 'table' AND m.name NOT LIKE 'sqlite\_%' ESCAPE '\'
ORDER BY
	m.name, p.cid
)";
    }

    std::string indexes_query(const TableName& table, std::string_view /*schema*/) const override {
        return "SELECT il.name, ix.name, ix.key = 0, ix.\"desc\" = 0 "
               "FROM pragma_index_list(" + quote_literal(table.name) + ") AS il, "
               "pragma_index_xinfo(il.name) AS ix "
               "WHERE ix.name IS NOT NULL "
               "ORDER BY il.name, ix.seqno";
    }

    /// Declared types are free text in SQLite; resolve by column affinity.
    sem::TypeResolver type_resolver() const noexcept override {
        return sem::type_from_sqlite_declaration;
    }
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Row decoding
// ─────────────────────────────────────────────────────────────────────────────

Status decode_column_row(const Row& row, ColumnRow* out) {
    if (row.size() != kColumnRowWidth) {
        return Status::Corruption("column metadata row has " + std::to_string(row.size()) +
                                  " values, expected " + std::to_string(kColumnRowWidth));
    }
    ColumnRow r;
    SMITHER_RETURN_IF_ERROR(decode_string(row, 0, "catalog", &r.catalog));
    SMITHER_RETURN_IF_ERROR(decode_string(row, 1, "schema", &r.schema));
    SMITHER_RETURN_IF_ERROR(decode_string(row, 2, "table", &r.table));
    SMITHER_RETURN_IF_ERROR(decode_string(row, 3, "column", &r.column));
    SMITHER_RETURN_IF_ERROR(decode_string(row, 4, "type", &r.type_name));
    SMITHER_RETURN_IF_ERROR(decode_bool(row, 5, "computed", &r.computed));
    SMITHER_RETURN_IF_ERROR(decode_bool(row, 6, "nullable", &r.nullable));
    SMITHER_RETURN_IF_ERROR(decode_bool(row, 7, "hidden", &r.hidden));
    *out = std::move(r);
    return Status::Ok();
}

Status decode_index_row(const Row& row, IndexRow* out) {
    if (row.size() != kIndexRowWidth) {
        return Status::Corruption("index metadata row has " + std::to_string(row.size()) +
                                  " values, expected " + std::to_string(kIndexRowWidth));
    }
    IndexRow r;
    SMITHER_RETURN_IF_ERROR(decode_string(row, 0, "index", &r.index));
    SMITHER_RETURN_IF_ERROR(decode_string(row, 1, "column", &r.column));
    SMITHER_RETURN_IF_ERROR(decode_bool(row, 2, "storing", &r.storing));
    SMITHER_RETURN_IF_ERROR(decode_bool(row, 3, "ascending", &r.ascending));
    *out = std::move(r);
    return Status::Ok();
}

// ─────────────────────────────────────────────────────────────────────────────
// Dialect selection and quoting
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(DialectKind kind) noexcept {
    switch (kind) {
        case DialectKind::kCockroach: return "cockroach";
        case DialectKind::kSqlite:    return "sqlite";
    }
    SMITHER_UNREACHABLE();
}

Status parse_dialect(std::string_view name, DialectKind* out) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "cockroach" || lower == "cockroachdb") {
        *out = DialectKind::kCockroach;
        return Status::Ok();
    }
    if (lower == "sqlite" || lower == "sqlite3") {
        *out = DialectKind::kSqlite;
        return Status::Ok();
    }
    return Status::InvalidArgument("unknown dialect: " + std::string(name));
}

std::unique_ptr<Dialect> make_dialect(DialectKind kind) {
    switch (kind) {
        case DialectKind::kCockroach: return std::make_unique<CockroachDialect>();
        case DialectKind::kSqlite:    return std::make_unique<SqliteDialect>();
    }
    SMITHER_UNREACHABLE();
}

std::string quote_literal(std::string_view value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'') out.push_back('\'');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string quote_identifier(std::string_view name) {
    std::string out = "\"";
    for (char c : name) {
        if (c == '"') out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

}  // namespace smither
