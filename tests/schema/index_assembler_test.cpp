/**
 * @file index_assembler_test.cpp
 * @brief Unit tests for IndexAssembler and assemble_indexes
 */

#include <gtest/gtest.h>

#include <set>

#include "schema/index_assembler.hpp"
#include "test_utils.hpp"

namespace smither {
namespace {

IndexRow make_row(std::string index, std::string column, bool storing, bool ascending) {
    return IndexRow{std::move(index), std::move(column), storing, ascending};
}

TEST(IndexAssemblerTest, KeyAndStoringScenario) {
    IndexAssembler assembler(TableName("db", "t"));
    assembler.add(make_row("idx1", "a", false, true));
    assembler.add(make_row("idx1", "b", true, false));

    IndexMap indexes = assembler.finish();
    ASSERT_EQ(indexes.size(), 1);
    const IndexDef& idx = indexes.at("idx1");
    EXPECT_EQ(idx.name, "idx1");
    EXPECT_EQ(idx.table, TableName("db", "t"));
    ASSERT_EQ(idx.key_columns.size(), 1);
    EXPECT_EQ(idx.key_columns[0], (IndexElem{"a", SortDirection::kAscending}));
    EXPECT_EQ(idx.storing_columns, std::vector<std::string>{"b"});
}

TEST(IndexAssemblerTest, DescendingKeys) {
    IndexAssembler assembler(TableName("db", "t"));
    assembler.add(make_row("i", "x", false, false));
    assembler.add(make_row("i", "y", false, true));

    IndexMap indexes = assembler.finish();
    const IndexDef& idx = indexes.at("i");
    ASSERT_EQ(idx.key_columns.size(), 2);
    EXPECT_EQ(idx.key_columns[0].direction, SortDirection::kDescending);
    EXPECT_EQ(idx.key_columns[1].direction, SortDirection::kAscending);
}

TEST(IndexAssemblerTest, KeyAndStoringPartitionColumns) {
    IndexAssembler assembler(TableName("db", "t"));
    const std::vector<IndexRow> rows = {
        make_row("i", "k1", false, true),  make_row("i", "s1", true, true),
        make_row("i", "k2", false, false), make_row("i", "s2", true, false),
        make_row("i", "k3", false, true),
    };
    for (const auto& row : rows) {
        assembler.add(row);
    }
    EXPECT_EQ(assembler.rows_seen(), rows.size());

    const IndexDef idx = assembler.finish().at("i");
    std::vector<std::string> keys;
    for (const auto& elem : idx.key_columns) {
        keys.push_back(elem.column);
    }
    EXPECT_EQ(keys, (std::vector<std::string>{"k1", "k2", "k3"}));
    EXPECT_EQ(idx.storing_columns, (std::vector<std::string>{"s1", "s2"}));

    std::set<std::string> all(keys.begin(), keys.end());
    for (const auto& s : idx.storing_columns) {
        EXPECT_TRUE(all.insert(s).second) << s << " is both key and storing";
    }
    EXPECT_EQ(all.size(), rows.size());
}

TEST(IndexAssemblerTest, SeparatesIndexesByName) {
    IndexAssembler assembler(TableName("db", "t"));
    assembler.add(make_row("primary", "id", false, true));
    assembler.add(make_row("by_name", "name", false, true));
    assembler.add(make_row("by_name", "id", false, true));

    IndexMap indexes = assembler.finish();
    ASSERT_EQ(indexes.size(), 2);
    EXPECT_EQ(indexes.at("primary").key_columns.size(), 1);
    EXPECT_EQ(indexes.at("by_name").key_columns.size(), 2);
}

TEST(IndexAssemblerTest, RendersSql) {
    IndexDef idx("i", TableName("db", "t"));
    idx.key_columns = {{"a", SortDirection::kAscending}, {"b", SortDirection::kDescending}};
    idx.storing_columns = {"c"};
    EXPECT_EQ(idx.to_sql(), "CREATE INDEX i ON db.t (a ASC, b DESC) STORING (c)");
    EXPECT_EQ((TableIndexName{TableName("db", "t"), "i"}).to_string(), "db.t@i");
}

// ─────────────────────────────────────────────────────────────────────────────
// assemble_indexes
// ─────────────────────────────────────────────────────────────────────────────

class AssembleIndexesTest : public ::testing::Test {
protected:
    void SetUp() override {
        dialect_ = make_dialect(DialectKind::kCockroach);
        tables_ = {
            TableRef(TableName("db", "t1"), {ColumnDef("a", sem::types::Int)}),
            TableRef(TableName("db", "t2"), {ColumnDef("b", sem::types::Int)}),
        };
    }

    std::string index_query(const std::string& table) const {
        return dialect_->indexes_query(TableName("db", table), "public");
    }

    test::FakeConnection conn_;
    std::unique_ptr<Dialect> dialect_;
    std::vector<TableRef> tables_;
};

TEST_F(AssembleIndexesTest, BuildsCatalogForEveryTable) {
    conn_.on(index_query("t1"), test::rows_result({
        test::index_row("primary", "a", false, true),
    }));
    conn_.on(index_query("t2"), test::rows_result({}));

    IndexCatalog catalog;
    ASSERT_TRUE(assemble_indexes(conn_, *dialect_, "public", tables_, &catalog).ok());
    ASSERT_EQ(catalog.size(), 2);
    EXPECT_EQ(catalog.at(TableName("db", "t1")).size(), 1);
    EXPECT_TRUE(catalog.at(TableName("db", "t2")).empty());
    EXPECT_EQ(conn_.queries().size(), 2);
}

TEST_F(AssembleIndexesTest, QueryFailureAbortsEverything) {
    conn_.on(index_query("t1"), test::rows_result({
        test::index_row("primary", "a", false, true),
    }));
    conn_.on(index_query("t2"), Result(Status::IOError("connection reset")));

    IndexCatalog catalog;
    catalog[TableName("db", "old")] = IndexMap{};
    auto status = assemble_indexes(conn_, *dialect_, "public", tables_, &catalog);
    EXPECT_EQ(status, Status::IOError("connection reset"));
    ASSERT_EQ(catalog.size(), 1);
    EXPECT_EQ(catalog.count(TableName("db", "old")), 1);
}

TEST_F(AssembleIndexesTest, UndecodableRowAborts) {
    conn_.on(index_query("t1"), test::rows_result({
        Row({Value("primary"), Value("a"), Value(), Value(true)}),
    }));
    conn_.on(index_query("t2"), test::rows_result({}));

    IndexCatalog catalog;
    auto status = assemble_indexes(conn_, *dialect_, "public", tables_, &catalog);
    EXPECT_EQ(status.code(), StatusCode::kCorruption);
    EXPECT_TRUE(catalog.empty());
}

}  // namespace
}  // namespace smither
