/**
 * @file inspect_args_test.cpp
 * @brief Unit tests for smither_inspect argument parsing
 */

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "api/inspect_args.hpp"

namespace smither {
namespace {

TEST(InspectArgsTest, ParsesAllOptions) {
    InspectArgs args;
    auto status = parse_inspect_args(
        {"db.sqlite", "--schema", "aux", "--seed", "42", "--picks", "3", "-v"}, &args);
    ASSERT_TRUE(status.ok()) << status.to_string();
    EXPECT_EQ(args.db_path, "db.sqlite");
    EXPECT_EQ(args.options.dialect, DialectKind::kSqlite);
    EXPECT_EQ(args.options.target_schema, "aux");
    EXPECT_EQ(args.options.seed, 42u);
    EXPECT_EQ(args.picks, 3u);
    EXPECT_TRUE(args.verbose);
    EXPECT_FALSE(args.help);
}

TEST(InspectArgsTest, DefaultsWithOnlyPath) {
    InspectArgs args;
    ASSERT_TRUE(parse_inspect_args({"db.sqlite"}, &args).ok());
    EXPECT_EQ(args.picks, config::kDefaultInspectPicks);
    EXPECT_EQ(args.options.seed, config::kDefaultSeed);
    EXPECT_FALSE(args.verbose);
}

TEST(InspectArgsTest, HelpIsNotAnError) {
    for (const char* flag : {"--help", "-h"}) {
        InspectArgs args;
        auto status = parse_inspect_args({flag}, &args);
        ASSERT_TRUE(status.ok()) << flag << ": " << status.to_string();
        EXPECT_TRUE(args.help) << flag;
    }
}

TEST(InspectArgsTest, HelpWinsOverMissingPath) {
    InspectArgs args;
    ASSERT_TRUE(parse_inspect_args({"--verbose", "--help"}, &args).ok());
    EXPECT_TRUE(args.help);
}

TEST(InspectArgsTest, RejectsNegativeCounts) {
    InspectArgs args;
    auto status = parse_inspect_args({"db.sqlite", "--picks", "-1"}, &args);
    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);

    status = parse_inspect_args({"db.sqlite", "--seed", "-7"}, &args);
    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
}

TEST(InspectArgsTest, RejectsMalformedCounts) {
    const std::vector<std::string> bad = {"", "abc", "12x", " 5", "+5",
                                          "99999999999999999999999"};
    for (const auto& text : bad) {
        InspectArgs args;
        auto status = parse_inspect_args({"db.sqlite", "--picks", text}, &args);
        EXPECT_EQ(status.code(), StatusCode::kInvalidArgument) << "'" << text << "'";
    }
}

TEST(InspectArgsTest, AcceptsFullRangeSeed) {
    InspectArgs args;
    ASSERT_TRUE(parse_inspect_args({"db.sqlite", "--seed", "18446744073709551615"}, &args).ok());
    EXPECT_EQ(args.options.seed, UINT64_MAX);
}

TEST(InspectArgsTest, RejectsMissingValue) {
    InspectArgs args;
    auto status = parse_inspect_args({"db.sqlite", "--picks"}, &args);
    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
}

TEST(InspectArgsTest, RejectsMissingPath) {
    InspectArgs args;
    auto status = parse_inspect_args({"--seed", "1"}, &args);
    EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
}

TEST(InspectArgsTest, RejectsUnknownFlagAndSecondPath) {
    InspectArgs args;
    EXPECT_EQ(parse_inspect_args({"db.sqlite", "--bogus"}, &args).code(),
              StatusCode::kInvalidArgument);
    EXPECT_EQ(parse_inspect_args({"a.sqlite", "b.sqlite"}, &args).code(),
              StatusCode::kInvalidArgument);
}

TEST(InspectArgsTest, FailureLeavesOutputUntouched) {
    InspectArgs args;
    args.db_path = "kept";
    ASSERT_FALSE(parse_inspect_args({"new.sqlite", "--picks", "-1"}, &args).ok());
    EXPECT_EQ(args.db_path, "kept");
}

}  // namespace
}  // namespace smither
