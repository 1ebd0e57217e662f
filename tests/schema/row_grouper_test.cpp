/**
 * @file row_grouper_test.cpp
 * @brief Unit tests for RowGrouper
 */

#include <gtest/gtest.h>

#include "schema/row_grouper.hpp"

namespace smither {
namespace {

ColumnRow make_row(std::string schema, std::string table, std::string column,
                   std::string type, bool nullable = false, bool hidden = false) {
    ColumnRow row;
    row.catalog = "db";
    row.schema = std::move(schema);
    row.table = std::move(table);
    row.column = std::move(column);
    row.type_name = std::move(type);
    row.nullable = nullable;
    row.hidden = hidden;
    return row;
}

TEST(RowGrouperTest, EmptyInputYieldsNoTables) {
    std::vector<TableRef> tables{TableRef()};
    ASSERT_TRUE(group_column_rows({}, "public", &tables).ok());
    EXPECT_TRUE(tables.empty());
}

TEST(RowGrouperTest, TwoTablesScenario) {
    std::vector<ColumnRow> rows = {
        make_row("public", "t1", "col_a", "int4", /*nullable=*/true),
        make_row("public", "t1", "col_b", "text", /*nullable=*/false),
        make_row("public", "t2", "col_c", "bool"),
    };

    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 2);

    EXPECT_EQ(tables[0].name(), TableName("db", "t1"));
    ASSERT_EQ(tables[0].column_count(), 2);
    EXPECT_EQ(tables[0].column(0).name(), "col_a");
    EXPECT_EQ(tables[0].column(0).type().family(), sem::TypeFamily::kInt);
    EXPECT_TRUE(tables[0].column(0).is_nullable());
    EXPECT_EQ(tables[0].column(1).name(), "col_b");
    EXPECT_EQ(tables[0].column(1).type(), sem::types::String);
    EXPECT_FALSE(tables[0].column(1).is_nullable());

    EXPECT_EQ(tables[1].name(), TableName("db", "t2"));
    ASSERT_EQ(tables[1].column_count(), 1);
    EXPECT_EQ(tables[1].column(0).name(), "col_c");
    EXPECT_EQ(tables[1].column(0).type(), sem::types::Bool);
}

TEST(RowGrouperTest, LastGroupIsFlushed) {
    std::vector<ColumnRow> rows = {make_row("public", "only", "x", "INT8")};
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables[0].name().name, "only");
}

TEST(RowGrouperTest, PreservesColumnOrderWithinRun) {
    std::vector<ColumnRow> rows;
    for (const char* name : {"e", "a", "d", "b", "c"}) {
        rows.push_back(make_row("public", "t", name, "INT8"));
    }
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    std::vector<std::string> names;
    for (const auto& col : tables[0].columns()) {
        names.push_back(col.name());
    }
    EXPECT_EQ(names, (std::vector<std::string>{"e", "a", "d", "b", "c"}));
}

TEST(RowGrouperTest, OtherSchemasAreConsumedButNotEmitted) {
    std::vector<ColumnRow> rows = {
        make_row("audit", "log", "id", "INT8"),
        make_row("audit", "log", "msg", "STRING"),
        make_row("public", "t", "id", "INT8"),
        make_row("scratch", "t", "id", "INT8"),
        make_row("public", "u", "id", "INT8"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 2);
    EXPECT_EQ(tables[0].name().name, "t");
    EXPECT_EQ(tables[0].column_count(), 1);
    EXPECT_EQ(tables[1].name().name, "u");
}

TEST(RowGrouperTest, SameTableNameInDifferentSchemasStartsNewGroup) {
    std::vector<ColumnRow> rows = {
        make_row("other", "t", "x", "INT8"),
        make_row("public", "t", "y", "INT8"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    ASSERT_EQ(tables[0].column_count(), 1);
    EXPECT_EQ(tables[0].column(0).name(), "y");
}

TEST(RowGrouperTest, HiddenColumnsAreDropped) {
    std::vector<ColumnRow> rows = {
        make_row("public", "t", "a", "INT8"),
        make_row("public", "t", "rowid", "INT8", false, /*hidden=*/true),
        make_row("public", "t", "b", "STRING"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables[0].column_count(), 2);
    EXPECT_EQ(tables[0].get_column_index("rowid"), -1);
}

TEST(RowGrouperTest, TableWithOnlyHiddenColumnsIsNotEmitted) {
    std::vector<ColumnRow> rows = {
        make_row("public", "a", "x", "INT8"),
        make_row("public", "ghost", "rowid", "INT8", false, /*hidden=*/true),
        make_row("public", "ghost", "crdb_internal_id", "INT8", false, /*hidden=*/true),
        make_row("public", "z", "y", "INT8"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 2);
    EXPECT_EQ(tables[0].name().name, "a");
    EXPECT_EQ(tables[1].name().name, "z");
}

TEST(RowGrouperTest, HiddenRowsDoNotSplitARun) {
    std::vector<ColumnRow> rows = {
        make_row("public", "t", "a", "INT8"),
        make_row("public", "u", "h", "INT8", false, /*hidden=*/true),
        make_row("public", "t", "b", "INT8"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables[0].column_count(), 2);
}

TEST(RowGrouperTest, ComputedFlagIsCarried) {
    ColumnRow row = make_row("public", "t", "c", "INT8");
    row.computed = true;
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows({row}, "public", &tables).ok());
    ASSERT_EQ(tables.size(), 1);
    EXPECT_TRUE(tables[0].column(0).is_computed());
}

TEST(RowGrouperTest, UnknownTypeFails) {
    std::vector<ColumnRow> rows = {
        make_row("public", "t", "a", "INT8"),
        make_row("public", "t", "g", "GEOMETRY"),
    };
    std::vector<TableRef> tables;
    auto status = group_column_rows(rows, "public", &tables);
    EXPECT_EQ(status.code(), StatusCode::kInternal);
    EXPECT_TRUE(tables.empty());
}

TEST(RowGrouperTest, SqliteResolverAcceptsAnyDeclaredType) {
    std::vector<ColumnRow> rows = {
        make_row("main", "t", "a", "TINYINT"),
        make_row("main", "t", "g", "GEOMETRY"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "main", &tables,
                                  sem::type_from_sqlite_declaration).ok());
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables[0].column(0).type(), sem::types::Int);
    EXPECT_EQ(tables[0].column(1).type(), sem::types::Decimal);
}

TEST(RowGrouperTest, UnknownTypeOutsideTargetSchemaIsIgnored) {
    std::vector<ColumnRow> rows = {
        make_row("other", "t", "g", "GEOMETRY"),
        make_row("public", "t", "a", "INT8"),
    };
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    EXPECT_EQ(tables.size(), 1);
}

TEST(RowGrouperTest, RunsProduceOneTableEach) {
    std::vector<ColumnRow> rows;
    const int runs = 7;
    for (int t = 0; t < runs; ++t) {
        for (int c = 0; c <= t; ++c) {
            rows.push_back(make_row("public", "t" + std::to_string(t),
                                    "c" + std::to_string(c), "INT8"));
        }
    }
    std::vector<TableRef> tables;
    ASSERT_TRUE(group_column_rows(rows, "public", &tables).ok());
    ASSERT_EQ(tables.size(), runs);
    for (int t = 0; t < runs; ++t) {
        EXPECT_EQ(tables[t].column_count(), static_cast<size_t>(t + 1));
    }
}

TEST(RowGrouperTest, GrouperIsReusableAfterFinish) {
    RowGrouper grouper("public");
    ASSERT_TRUE(grouper.add(make_row("public", "t", "a", "INT8")).ok());
    EXPECT_EQ(grouper.finish().size(), 1);
    EXPECT_TRUE(grouper.finish().empty());
    ASSERT_TRUE(grouper.add(make_row("public", "u", "a", "INT8")).ok());
    auto tables = grouper.finish();
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables[0].name().name, "u");
}

}  // namespace
}  // namespace smither
