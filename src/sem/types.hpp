#pragma once

/**
 * @file types.hpp
 * @brief Semantic SQL types of the engine under test
 *
 * A Type pairs a semantic family (the classification used to decide which
 * expressions are interchangeable) with the concrete OID the engine reports.
 * INT2, INT4 and INT8 share the INT family but have distinct OIDs, and the
 * catalogs are keyed by OID.
 */

#include <array>
#include <cstdint>
#include <string_view>

#include "common/types.hpp"
#include "smither/status.hpp"

namespace smither::sem {

/**
 * @brief Semantic type families
 */
enum class TypeFamily : uint8_t {
    kUnknown = 0,
    kBool,
    kInt,
    kFloat,
    kDecimal,
    kString,
    kBytes,
    kDate,
    kTime,
    kTimeTZ,
    kTimestamp,
    kTimestampTZ,
    kInterval,
    kUuid,
    kJson,
    kINet,
    kOid,
    kBit,
    kArray,
    kAny,
};

[[nodiscard]] std::string_view to_string(TypeFamily family) noexcept;

/**
 * @brief A concrete SQL type
 */
class Type {
public:
    constexpr Type() = default;
    constexpr Type(TypeFamily family, oid_t oid, std::string_view name,
                   oid_t elem_oid = INVALID_OID)
        : family_(family), oid_(oid), name_(name), elem_oid_(elem_oid) {}

    [[nodiscard]] constexpr TypeFamily family() const noexcept { return family_; }
    [[nodiscard]] constexpr oid_t oid() const noexcept { return oid_; }
    [[nodiscard]] constexpr std::string_view name() const noexcept { return name_; }

    /// Element type OID for arrays, INVALID_OID otherwise
    [[nodiscard]] constexpr oid_t elem_oid() const noexcept { return elem_oid_; }

    [[nodiscard]] constexpr bool is_array() const noexcept {
        return family_ == TypeFamily::kArray;
    }

    constexpr bool operator==(const Type& other) const noexcept {
        return oid_ == other.oid_;
    }
    constexpr bool operator!=(const Type& other) const noexcept {
        return !(*this == other);
    }

private:
    TypeFamily family_ = TypeFamily::kUnknown;
    oid_t oid_ = 705;
    std::string_view name_ = "UNKNOWN";
    oid_t elem_oid_ = INVALID_OID;
};

namespace types {

// OIDs follow the PostgreSQL catalog, which CockroachDB mirrors.

inline constexpr Type Unknown{TypeFamily::kUnknown, 705, "UNKNOWN"};
inline constexpr Type Any{TypeFamily::kAny, 2276, "ANY"};

inline constexpr Type Bool{TypeFamily::kBool, 16, "BOOL"};
inline constexpr Type Int2{TypeFamily::kInt, 21, "INT2"};
inline constexpr Type Int4{TypeFamily::kInt, 23, "INT4"};
inline constexpr Type Int{TypeFamily::kInt, 20, "INT8"};
inline constexpr Type Float4{TypeFamily::kFloat, 700, "FLOAT4"};
inline constexpr Type Float{TypeFamily::kFloat, 701, "FLOAT8"};
inline constexpr Type Decimal{TypeFamily::kDecimal, 1700, "DECIMAL"};
inline constexpr Type String{TypeFamily::kString, 25, "STRING"};
inline constexpr Type VarChar{TypeFamily::kString, 1043, "VARCHAR"};
inline constexpr Type Bytes{TypeFamily::kBytes, 17, "BYTES"};
inline constexpr Type Date{TypeFamily::kDate, 1082, "DATE"};
inline constexpr Type Time{TypeFamily::kTime, 1083, "TIME"};
inline constexpr Type Timestamp{TypeFamily::kTimestamp, 1114, "TIMESTAMP"};
inline constexpr Type TimestampTZ{TypeFamily::kTimestampTZ, 1184, "TIMESTAMPTZ"};
inline constexpr Type Interval{TypeFamily::kInterval, 1186, "INTERVAL"};
inline constexpr Type Uuid{TypeFamily::kUuid, 2950, "UUID"};
inline constexpr Type Jsonb{TypeFamily::kJson, 3802, "JSONB"};
inline constexpr Type INet{TypeFamily::kINet, 869, "INET"};
inline constexpr Type Oid{TypeFamily::kOid, 26, "OID"};
inline constexpr Type TimeTZ{TypeFamily::kTimeTZ, 1266, "TIMETZ"};
inline constexpr Type Bit{TypeFamily::kBit, 1560, "BIT"};
inline constexpr Type VarBit{TypeFamily::kBit, 1562, "VARBIT"};
inline constexpr Type Name{TypeFamily::kString, 19, "NAME"};
inline constexpr Type QChar{TypeFamily::kString, 18, "\"char\""};

inline constexpr Type BoolArray{TypeFamily::kArray, 1000, "BOOL[]", 16};
inline constexpr Type Int2Array{TypeFamily::kArray, 1005, "INT2[]", 21};
inline constexpr Type Int4Array{TypeFamily::kArray, 1007, "INT4[]", 23};
inline constexpr Type IntArray{TypeFamily::kArray, 1016, "INT8[]", 20};
inline constexpr Type Float4Array{TypeFamily::kArray, 1021, "FLOAT4[]", 700};
inline constexpr Type FloatArray{TypeFamily::kArray, 1022, "FLOAT8[]", 701};
inline constexpr Type DecimalArray{TypeFamily::kArray, 1231, "DECIMAL[]", 1700};
inline constexpr Type StringArray{TypeFamily::kArray, 1009, "STRING[]", 25};
inline constexpr Type VarCharArray{TypeFamily::kArray, 1015, "VARCHAR[]", 1043};
inline constexpr Type BytesArray{TypeFamily::kArray, 1001, "BYTES[]", 17};
inline constexpr Type DateArray{TypeFamily::kArray, 1182, "DATE[]", 1082};
inline constexpr Type TimeArray{TypeFamily::kArray, 1183, "TIME[]", 1083};
inline constexpr Type TimestampArray{TypeFamily::kArray, 1115, "TIMESTAMP[]", 1114};
inline constexpr Type TimestampTZArray{TypeFamily::kArray, 1185, "TIMESTAMPTZ[]", 1184};
inline constexpr Type IntervalArray{TypeFamily::kArray, 1187, "INTERVAL[]", 1186};
inline constexpr Type UuidArray{TypeFamily::kArray, 2951, "UUID[]", 2950};
inline constexpr Type JsonbArray{TypeFamily::kArray, 3807, "JSONB[]", 3802};
inline constexpr Type INetArray{TypeFamily::kArray, 1041, "INET[]", 869};
inline constexpr Type OidArray{TypeFamily::kArray, 1028, "OID[]", 26};
inline constexpr Type AnyArray{TypeFamily::kArray, 2277, "ANY[]", 2276};

/**
 * @brief Every non-array type a generated expression may produce
 *
 * Membership is decided by family, so VARCHAR qualifies through STRING.
 */
inline constexpr std::array<Type, 17> kAnyNonArray = {
    Bool,   Int,         Float,    Decimal, Date,
    Timestamp, Interval, String,   Bytes,   TimestampTZ,
    Oid,    Uuid,        INet,     Time,    TimeTZ,
    Jsonb,  VarBit,
};

/// Every concrete type known to the library, arrays included
inline constexpr std::array<Type, 46> kAll = {
    Unknown,     Any,           Bool,        Int2,         Int4,
    Int,         Float4,        Float,       Decimal,      String,
    VarChar,     Bytes,         Date,        Time,         Timestamp,
    TimestampTZ, Interval,      Uuid,        Jsonb,        INet,
    Oid,         BoolArray,     Int2Array,   Int4Array,    IntArray,
    Float4Array, FloatArray,    DecimalArray, StringArray, VarCharArray,
    BytesArray,  DateArray,     TimeArray,   TimestampArray, TimestampTZArray,
    IntervalArray, UuidArray,   JsonbArray,  INetArray,    OidArray,
    AnyArray,    TimeTZ,        Bit,         VarBit,       Name,
    QChar,
};

}  // namespace types

/// Resolves an introspected type name
using TypeResolver = Status (*)(std::string_view name, Type* out);

/**
 * @brief Whether a type's family belongs to types::kAnyNonArray
 */
[[nodiscard]] bool is_non_array_family(const Type& type) noexcept;

/**
 * @brief Look up a type by OID
 * @return Pointer into static storage, or nullptr if the OID is unknown
 */
[[nodiscard]] const Type* type_from_oid(oid_t oid) noexcept;

/**
 * @brief Resolve a textual type name reported by introspection
 *
 * Matching is case-insensitive. Width and precision modifiers are ignored
 * ("VARCHAR(10)", "DECIMAL(10,2)"), so is a "COLLATE x" suffix, and a
 * trailing "[]" yields the array of the element type.
 *
 * @return Status::Internal if the name is not in the lookup table
 */
[[nodiscard]] Status type_from_name(std::string_view name, Type* out);

/**
 * @brief Resolve a SQLite declared column type
 *
 * Names in the lookup table resolve as type_from_name does. Anything else
 * gets the type of its SQLite column affinity: INT anywhere makes INT8,
 * CHAR, CLOB or TEXT make STRING, BLOB or no type makes BYTES, REAL, FLOA
 * or DOUB make FLOAT8, and everything else is DECIMAL. Never fails.
 */
[[nodiscard]] Status type_from_sqlite_declaration(std::string_view declared, Type* out);

}  // namespace smither::sem
