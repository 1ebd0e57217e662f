/**
 * @file introspection_test.cpp
 * @brief Unit tests for introspection row decoding and dialects
 */

#include <gtest/gtest.h>

#include "schema/introspection.hpp"
#include "test_utils.hpp"

namespace smither {
namespace {

TEST(IntrospectionTest, DecodesColumnRow) {
    ColumnRow row;
    auto status = decode_column_row(
        test::column_row("db", "public", "t", "a", "INT8", true, false, false), &row);
    ASSERT_TRUE(status.ok()) << status.to_string();
    EXPECT_EQ(row.catalog, "db");
    EXPECT_EQ(row.schema, "public");
    EXPECT_EQ(row.table, "t");
    EXPECT_EQ(row.column, "a");
    EXPECT_EQ(row.type_name, "INT8");
    EXPECT_TRUE(row.nullable);
    EXPECT_FALSE(row.computed);
    EXPECT_FALSE(row.hidden);
}

TEST(IntrospectionTest, AcceptsIntegerBooleans) {
    Row raw({Value("idx"), Value("c"), Value(int64_t{1}), Value(int64_t{0})});
    IndexRow row;
    ASSERT_TRUE(decode_index_row(raw, &row).ok());
    EXPECT_TRUE(row.storing);
    EXPECT_FALSE(row.ascending);
}

TEST(IntrospectionTest, RejectsWrongArity) {
    Row raw({Value("idx"), Value("c"), Value(true)});
    IndexRow row;
    auto status = decode_index_row(raw, &row);
    EXPECT_EQ(status.code(), StatusCode::kCorruption);
}

TEST(IntrospectionTest, RejectsNullAndWrongShapes) {
    ColumnRow row;
    Row null_table({Value("db"), Value("public"), Value(), Value("a"), Value("INT8"),
                    Value(false), Value(false), Value(false)});
    EXPECT_EQ(decode_column_row(null_table, &row).code(), StatusCode::kCorruption);

    Row bad_flag({Value("db"), Value("public"), Value("t"), Value("a"), Value("INT8"),
                  Value(int64_t{7}), Value(false), Value(false)});
    EXPECT_EQ(decode_column_row(bad_flag, &row).code(), StatusCode::kCorruption);
}

TEST(IntrospectionTest, CockroachQueries) {
    auto dialect = make_dialect(DialectKind::kCockroach);
    EXPECT_EQ(dialect->default_schema(), "public");

    const std::string columns = dialect->columns_query("public");
    EXPECT_NE(columns.find("information_schema.columns"), std::string::npos);
    EXPECT_NE(columns.find("table_schema = 'public'"), std::string::npos);
    EXPECT_NE(columns.find("ORDER BY"), std::string::npos);

    EXPECT_EQ(dialect->indexes_query(TableName("db", "my\"t"), "public"),
              "SELECT index_name, column_name, storing, direction = 'ASC' "
              "FROM [SHOW INDEXES FROM \"db\".\"public\".\"my\"\"t\"]");
}

TEST(IntrospectionTest, SqliteQueriesQuoteTableName) {
    auto dialect = make_dialect(DialectKind::kSqlite);
    EXPECT_EQ(dialect->default_schema(), "main");
    const std::string sql = dialect->indexes_query(TableName("main", "o'brien"), "main");
    EXPECT_NE(sql.find("pragma_index_list('o''brien')"), std::string::npos);
}

TEST(IntrospectionTest, ParsesDialectNames) {
    DialectKind kind = DialectKind::kCockroach;
    ASSERT_TRUE(parse_dialect("SQLite", &kind).ok());
    EXPECT_EQ(kind, DialectKind::kSqlite);
    ASSERT_TRUE(parse_dialect("cockroachdb", &kind).ok());
    EXPECT_EQ(kind, DialectKind::kCockroach);
    EXPECT_EQ(parse_dialect("oracle", &kind).code(), StatusCode::kInvalidArgument);
}

TEST(IntrospectionTest, QuotesLiteralsAndIdentifiers) {
    EXPECT_EQ(quote_literal("it's"), "'it''s'");
    EXPECT_EQ(quote_identifier("a\"b"), "\"a\"\"b\"");
}

}  // namespace
}  // namespace smither
