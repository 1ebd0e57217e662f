/**
 * @file types_test.cpp
 * @brief Unit tests for type name resolution
 */

#include <gtest/gtest.h>

#include "sem/types.hpp"

namespace smither::sem {
namespace {

TEST(TypesTest, ResolvesCanonicalNames) {
    Type type;
    ASSERT_TRUE(type_from_name("INT8", &type).ok());
    EXPECT_EQ(type, types::Int);
    ASSERT_TRUE(type_from_name("STRING", &type).ok());
    EXPECT_EQ(type, types::String);
    ASSERT_TRUE(type_from_name("BOOL", &type).ok());
    EXPECT_EQ(type, types::Bool);
    ASSERT_TRUE(type_from_name("TIMESTAMPTZ", &type).ok());
    EXPECT_EQ(type, types::TimestampTZ);
}

TEST(TypesTest, IsCaseInsensitive) {
    Type type;
    ASSERT_TRUE(type_from_name("int4", &type).ok());
    EXPECT_EQ(type, types::Int4);
    EXPECT_EQ(type.family(), TypeFamily::kInt);
    ASSERT_TRUE(type_from_name("Text", &type).ok());
    EXPECT_EQ(type, types::String);
}

TEST(TypesTest, IgnoresModifiers) {
    Type type;
    ASSERT_TRUE(type_from_name("VARCHAR(10)", &type).ok());
    EXPECT_EQ(type, types::VarChar);
    EXPECT_EQ(type.family(), TypeFamily::kString);
    ASSERT_TRUE(type_from_name("DECIMAL(10,2)", &type).ok());
    EXPECT_EQ(type, types::Decimal);
    ASSERT_TRUE(type_from_name("  character   varying (255) ", &type).ok());
    EXPECT_EQ(type, types::VarChar);
}

TEST(TypesTest, MultiWordNames) {
    Type type;
    ASSERT_TRUE(type_from_name("TIMESTAMP WITH TIME ZONE", &type).ok());
    EXPECT_EQ(type, types::TimestampTZ);
    ASSERT_TRUE(type_from_name("double precision", &type).ok());
    EXPECT_EQ(type, types::Float);
}

TEST(TypesTest, ResolvesArrays) {
    Type type;
    ASSERT_TRUE(type_from_name("INT8[]", &type).ok());
    EXPECT_EQ(type, types::IntArray);
    EXPECT_TRUE(type.is_array());
    EXPECT_EQ(type.elem_oid(), types::Int.oid());

    ASSERT_TRUE(type_from_name("STRING(5)[]", &type).ok());
    EXPECT_EQ(type, types::StringArray);
}

TEST(TypesTest, ResolvesBitNameAndTimeTz) {
    Type type;
    ASSERT_TRUE(type_from_name("BIT(3)", &type).ok());
    EXPECT_EQ(type, types::Bit);
    ASSERT_TRUE(type_from_name("VARBIT", &type).ok());
    EXPECT_EQ(type, types::VarBit);
    EXPECT_EQ(type.family(), TypeFamily::kBit);
    ASSERT_TRUE(type_from_name("NAME", &type).ok());
    EXPECT_EQ(type, types::Name);
    ASSERT_TRUE(type_from_name("\"char\"", &type).ok());
    EXPECT_EQ(type, types::QChar);
    EXPECT_EQ(type.family(), TypeFamily::kString);
    ASSERT_TRUE(type_from_name("TIMETZ", &type).ok());
    EXPECT_EQ(type, types::TimeTZ);
    ASSERT_TRUE(type_from_name("time with time zone", &type).ok());
    EXPECT_EQ(type, types::TimeTZ);
}

TEST(TypesTest, CollatedStringsKeepBaseType) {
    Type type;
    ASSERT_TRUE(type_from_name("STRING COLLATE de", &type).ok());
    EXPECT_EQ(type, types::String);
    ASSERT_TRUE(type_from_name("VARCHAR(5) COLLATE en_US", &type).ok());
    EXPECT_EQ(type, types::VarChar);
    ASSERT_TRUE(type_from_name("STRING COLLATE en[]", &type).ok());
    EXPECT_EQ(type, types::StringArray);
}

TEST(TypesTest, SqliteDeclarationsUseAffinity) {
    struct Case {
        const char* declared;
        Type expected;
    };
    const Case cases[] = {
        {"TINYINT", types::Int},
        {"MEDIUMINT", types::Int},
        {"UNSIGNED BIG INT", types::Int},
        {"INT2", types::Int2},
        {"NVARCHAR(20)", types::String},
        {"NCHAR(5)", types::String},
        {"VARYING CHARACTER(255)", types::String},
        {"CLOB", types::String},
        {"", types::Bytes},
        {"blob", types::Bytes},
        {"DOUBLE", types::Float},
        {"FLOATING", types::Float},
        {"FLOATING POINT", types::Int},  // "POINT" contains INT
        {"NUMERIC(10,5)", types::Decimal},
        {"GEOMETRY", types::Decimal},
        {"BOOLEAN", types::Bool},
        {"DATETIME", types::Timestamp},
        {"VARCHAR(10)", types::VarChar},
    };
    for (const auto& c : cases) {
        Type type;
        ASSERT_TRUE(type_from_sqlite_declaration(c.declared, &type).ok()) << c.declared;
        EXPECT_EQ(type, c.expected) << c.declared;
    }
}

TEST(TypesTest, UnknownNameFailsWithInternal) {
    Type type = types::Bool;
    auto status = type_from_name("GEOGRAPHY", &type);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(status.code(), StatusCode::kInternal);
    EXPECT_NE(status.message().find("GEOGRAPHY"), std::string_view::npos);
    EXPECT_EQ(type, types::Bool);  // untouched
}

TEST(TypesTest, NonArrayFamilies) {
    EXPECT_TRUE(is_non_array_family(types::Int));
    EXPECT_TRUE(is_non_array_family(types::Int4));
    EXPECT_TRUE(is_non_array_family(types::VarChar));
    EXPECT_FALSE(is_non_array_family(types::IntArray));
    EXPECT_FALSE(is_non_array_family(types::Any));
    EXPECT_FALSE(is_non_array_family(types::Unknown));
    EXPECT_TRUE(is_non_array_family(types::Bit));
    EXPECT_TRUE(is_non_array_family(types::TimeTZ));
}

TEST(TypesTest, LookupByOid) {
    const Type* type = type_from_oid(1700);
    ASSERT_NE(type, nullptr);
    EXPECT_EQ(*type, types::Decimal);
    EXPECT_EQ(type_from_oid(99999), nullptr);
}

}  // namespace
}  // namespace smither::sem
