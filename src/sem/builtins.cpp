/**
 * @file builtins.cpp
 * @brief Builtin operators and functions of the engine under test
 *
 * The set mirrors CockroachDB's builtins closely enough for statement
 * generation: every overload carries the return type the engine reports, and
 * the metadata the function catalog filters on (class, category, privacy and
 * documentation) is kept as the engine declares it.
 */

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sem/registry.hpp"

namespace smither::sem {

namespace {

using namespace types;  // NOLINT

constexpr auto kNormal = FunctionClass::kNormal;
constexpr auto kAggregate = FunctionClass::kAggregate;
constexpr auto kWindow = FunctionClass::kWindow;
constexpr auto kGenerator = FunctionClass::kGenerator;

Overload ov(std::vector<Type> args, std::optional<Type> ret, std::string info = "") {
    Overload o;
    o.arg_types = std::move(args);
    o.return_type = ret;
    o.info = std::move(info);
    return o;
}

void define(Registry& r, std::string name, FunctionClass cls, std::string category,
            std::vector<Overload> overloads, bool is_private = false) {
    FunctionDefinition def;
    def.name = std::move(name);
    def.function_class = cls;
    def.category = std::move(category);
    def.is_private = is_private;
    def.overloads = std::move(overloads);
    r.add_function(std::move(def));
}

// ─────────────────────────────────────────────────────────────────────────────
// Binary operators
// ─────────────────────────────────────────────────────────────────────────────

void register_binary_operators(Registry& r) {
    auto add = [&r](BinaryOperator op, Type left, Type right, Type ret) {
        r.add_binary_operator(op, BinOp{left, right, ret});
    };
    using B = BinaryOperator;

    add(B::kBitand, Int, Int, Int);
    add(B::kBitand, INet, INet, INet);
    add(B::kBitor, Int, Int, Int);
    add(B::kBitor, INet, INet, INet);
    add(B::kBitxor, Int, Int, Int);

    add(B::kPlus, Int, Int, Int);
    add(B::kPlus, Float, Float, Float);
    add(B::kPlus, Decimal, Decimal, Decimal);
    add(B::kPlus, Decimal, Int, Decimal);
    add(B::kPlus, Int, Decimal, Decimal);
    add(B::kPlus, Date, Int, Date);
    add(B::kPlus, Int, Date, Date);
    add(B::kPlus, Date, Time, Timestamp);
    add(B::kPlus, Time, Date, Timestamp);
    add(B::kPlus, Date, Interval, Timestamp);
    add(B::kPlus, Interval, Date, Timestamp);
    add(B::kPlus, Timestamp, Interval, Timestamp);
    add(B::kPlus, Interval, Timestamp, Timestamp);
    add(B::kPlus, TimestampTZ, Interval, TimestampTZ);
    add(B::kPlus, Interval, TimestampTZ, TimestampTZ);
    add(B::kPlus, Time, Interval, Time);
    add(B::kPlus, Interval, Time, Time);
    add(B::kPlus, Interval, Interval, Interval);
    add(B::kPlus, INet, Int, INet);
    add(B::kPlus, Int, INet, INet);

    add(B::kMinus, Int, Int, Int);
    add(B::kMinus, Float, Float, Float);
    add(B::kMinus, Decimal, Decimal, Decimal);
    add(B::kMinus, Decimal, Int, Decimal);
    add(B::kMinus, Int, Decimal, Decimal);
    add(B::kMinus, Date, Int, Date);
    add(B::kMinus, Date, Date, Int);
    add(B::kMinus, Date, Interval, Timestamp);
    add(B::kMinus, Date, Time, Timestamp);
    add(B::kMinus, Time, Time, Interval);
    add(B::kMinus, Time, Interval, Time);
    add(B::kMinus, Timestamp, Timestamp, Interval);
    add(B::kMinus, TimestampTZ, TimestampTZ, Interval);
    add(B::kMinus, Timestamp, Interval, Timestamp);
    add(B::kMinus, TimestampTZ, Interval, TimestampTZ);
    add(B::kMinus, Interval, Interval, Interval);
    add(B::kMinus, Jsonb, String, Jsonb);
    add(B::kMinus, Jsonb, Int, Jsonb);
    add(B::kMinus, INet, INet, Int);
    add(B::kMinus, INet, Int, INet);

    add(B::kMult, Int, Int, Int);
    add(B::kMult, Float, Float, Float);
    add(B::kMult, Decimal, Decimal, Decimal);
    add(B::kMult, Decimal, Int, Decimal);
    add(B::kMult, Int, Decimal, Decimal);
    add(B::kMult, Int, Interval, Interval);
    add(B::kMult, Interval, Int, Interval);
    add(B::kMult, Interval, Float, Interval);
    add(B::kMult, Float, Interval, Interval);

    add(B::kDiv, Int, Int, Decimal);
    add(B::kDiv, Float, Float, Float);
    add(B::kDiv, Decimal, Decimal, Decimal);
    add(B::kDiv, Decimal, Int, Decimal);
    add(B::kDiv, Int, Decimal, Decimal);
    add(B::kDiv, Interval, Int, Interval);
    add(B::kDiv, Interval, Float, Interval);

    add(B::kFloorDiv, Int, Int, Int);
    add(B::kFloorDiv, Float, Float, Float);
    add(B::kFloorDiv, Decimal, Decimal, Decimal);
    add(B::kFloorDiv, Decimal, Int, Decimal);
    add(B::kFloorDiv, Int, Decimal, Decimal);

    add(B::kMod, Int, Int, Int);
    add(B::kMod, Float, Float, Float);
    add(B::kMod, Decimal, Decimal, Decimal);
    add(B::kMod, Decimal, Int, Decimal);
    add(B::kMod, Int, Decimal, Decimal);

    add(B::kPow, Int, Int, Int);
    add(B::kPow, Float, Float, Float);
    add(B::kPow, Decimal, Decimal, Decimal);
    add(B::kPow, Decimal, Int, Decimal);
    add(B::kPow, Int, Decimal, Decimal);

    add(B::kConcat, String, String, String);
    add(B::kConcat, Bytes, Bytes, Bytes);
    add(B::kConcat, Jsonb, Jsonb, Jsonb);
    add(B::kConcat, IntArray, Int, IntArray);
    add(B::kConcat, Int, IntArray, IntArray);
    add(B::kConcat, StringArray, String, StringArray);
    add(B::kConcat, String, StringArray, StringArray);
    add(B::kConcat, IntArray, IntArray, IntArray);
    add(B::kConcat, StringArray, StringArray, StringArray);

    add(B::kLShift, Int, Int, Int);
    add(B::kRShift, Int, Int, Int);

    add(B::kJSONFetchVal, Jsonb, String, Jsonb);
    add(B::kJSONFetchVal, Jsonb, Int, Jsonb);
    add(B::kJSONFetchText, Jsonb, String, String);
    add(B::kJSONFetchText, Jsonb, Int, String);
    add(B::kJSONFetchValPath, Jsonb, StringArray, Jsonb);
    add(B::kJSONFetchTextPath, Jsonb, StringArray, String);
}

// ─────────────────────────────────────────────────────────────────────────────
// Scalar functions
// ─────────────────────────────────────────────────────────────────────────────

void register_scalar_functions(Registry& r) {
    define(r, "length", kNormal, "String and byte", {
        ov({String}, Int, "Calculates the number of characters in `val`."),
        ov({Bytes}, Int, "Calculates the number of bytes in `val`."),
    });
    define(r, "lower", kNormal, "String and byte", {
        ov({String}, String, "Converts all characters in `val` to their lower-case equivalents."),
    });
    define(r, "upper", kNormal, "String and byte", {
        ov({String}, String, "Converts all characters in `val` to their upper-case equivalents."),
    });
    define(r, "concat", kNormal, "String and byte", {
        ov({String}, String, "Concatenates a comma-separated list of strings."),
    });
    define(r, "substring", kNormal, "String and byte", {
        ov({String, Int}, String, "Returns a substring of `input` starting at `start_pos`."),
        ov({String, Int, Int}, String, "Returns a substring of `input` of length `length`."),
        ov({String, String}, String, "Returns a substring of `input` that matches the regular expression."),
    });
    define(r, "to_hex", kNormal, "String and byte", {
        ov({Int}, String, "Converts `val` to its hexadecimal representation."),
        ov({Bytes}, String, "Converts `val` to its hexadecimal representation."),
    });
    define(r, "md5", kNormal, "Cryptographic", {
        ov({String}, String, "Calculates the MD5 hash value of a set of values."),
        ov({Bytes}, String, "Calculates the MD5 hash value of a set of values."),
    });
    define(r, "string_to_array", kNormal, "Array", {
        ov({String, String}, StringArray, "Split a string into components on a delimiter."),
    });
    define(r, "array_length", kNormal, "Array", {
        ov({AnyArray, Int}, Int, "Calculates the length of `input` on the provided `array_dimension`."),
    });
    define(r, "array_append", kNormal, "Array", {
        ov({AnyArray, Any}, std::nullopt, "Appends `elem` to `array`, returning the result."),
    });

    define(r, "abs", kNormal, "Math and numeric", {
        ov({Float}, Float, "Calculates the absolute value of `val`."),
        ov({Decimal}, Decimal, "Calculates the absolute value of `val`."),
        ov({Int}, Int, "Calculates the absolute value of `val`."),
    });
    define(r, "sqrt", kNormal, "Math and numeric", {
        ov({Float}, Float, "Calculates the square root of `val`."),
        ov({Decimal}, Decimal, "Calculates the square root of `val`."),
    });
    define(r, "floor", kNormal, "Math and numeric", {
        ov({Float}, Float, "Calculates the largest integer not greater than `val`."),
        ov({Decimal}, Decimal, "Calculates the largest integer not greater than `val`."),
    });
    define(r, "ceil", kNormal, "Math and numeric", {
        ov({Float}, Float, "Calculates the smallest integer not smaller than `val`."),
        ov({Decimal}, Decimal, "Calculates the smallest integer not smaller than `val`."),
    });
    define(r, "round", kNormal, "Math and numeric", {
        ov({Float}, Float, "Rounds `val` to the nearest integer."),
        ov({Decimal, Int}, Decimal, "Keeps `decimal_accuracy` number of figures to the right of the zero position."),
    });
    define(r, "random", kNormal, "Math and numeric", {
        ov({}, Float, "Returns a random float between 0 and 1."),
    });

    define(r, "now", kNormal, "Date and time", {
        ov({}, TimestampTZ, "Returns the time of the current transaction."),
    });
    define(r, "current_date", kNormal, "Date and time", {
        ov({}, Date, "Returns the date of the current transaction."),
    });
    define(r, "age", kNormal, "Date and time", {
        ov({TimestampTZ}, Interval, "Calculates the interval between `val` and the current time."),
        ov({TimestampTZ, TimestampTZ}, Interval, "Calculates the interval between `begin` and `end`."),
    });
    define(r, "extract", kNormal, "Date and time", {
        ov({String, Timestamp}, Float, "Extracts `element` from `input`."),
        ov({String, Date}, Float, "Extracts `element` from `input`."),
        ov({String, Interval}, Float, "Extracts `element` from `input`."),
    });
    define(r, "timezone", kNormal, "Date and time", {
        ov({String, Timestamp}, TimestampTZ, "Treat given time stamp without time zone as located in the specified time zone."),
        ov({String, TimestampTZ}, Timestamp, "Convert given time stamp with time zone to the new time zone."),
        ov({String, Time}, Time, "Not usable; time zone conversion of TIME values is not supported."),
    });

    define(r, "gen_random_uuid", kNormal, "ID generation", {
        ov({}, Uuid, "Generates a random UUID and returns it as a value of UUID type."),
    });
    define(r, "unique_rowid", kNormal, "ID generation", {
        ov({}, Int, "Returns a unique ID used by the engine to generate unique row IDs."),
    });

    define(r, "json_typeof", kNormal, "JSONB", {
        ov({Jsonb}, String, "Returns the type of the outermost JSON value as a text string."),
    });
    define(r, "jsonb_build_object", kNormal, "JSONB", {
        ov({Any}, Jsonb, "Builds a JSON object out of a variadic argument list."),
    });
    define(r, "jsonb_pretty", kNormal, "JSONB", {
        ov({Jsonb}, String, "Returns the given JSON value as a STRING indented and with newlines."),
    });

    define(r, "host", kNormal, "IP address", {
        ov({INet}, String, "Extracts the address part of the combined address/prefixlen value as text."),
    });
    define(r, "family", kNormal, "IP address", {
        ov({INet}, Int, "Extracts the IP family of the value; 4 for IPv4, 6 for IPv6."),
    });

    define(r, "greatest", kNormal, "Comparison", {
        ov({Any}, std::nullopt, "Returns the element with the greatest value."),
    });
    define(r, "least", kNormal, "Comparison", {
        ov({Any}, std::nullopt, "Returns the element with the lowest value."),
    });

    define(r, "version", kNormal, "System info", {
        ov({}, String, "Returns the node's version of the engine."),
    });
    define(r, "current_database", kNormal, "System info", {
        ov({}, String, "Returns the current database."),
    });
    define(r, "pg_sleep", kNormal, "System info", {
        ov({Float}, Bool, "pg_sleep makes the current session's process sleep until `seconds` seconds have elapsed."),
    });

    define(r, "pg_typeof", kNormal, "Compatibility", {
        ov({Any}, String, "Returns the type of its argument."),
    });
    define(r, "format_type", kNormal, "Compatibility", {
        ov({Oid, Int}, String, "Returns the SQL name of a data type identified by its type OID."),
    });
    define(r, "has_table_privilege", kNormal, "Compatibility", {
        ov({String, String}, Bool, "Returns whether or not the current user has privileges for the table."),
    });

    define(r, "crdb_internal.force_error", kNormal, "System info", {
        ov({String, String}, Int, "This function is used only by the engine's developers for testing purposes."),
    });
    define(r, "crdb_internal.force_panic", kNormal, "System info", {
        ov({String}, Int, "This function is used only by the engine's developers for testing purposes."),
    });
    define(r, "crdb_internal.force_retry", kNormal, "System info", {
        ov({Interval}, Int, "This function is used only by the engine's developers for testing purposes."),
    });
    define(r, "crdb_internal.set_vmodule", kNormal, "System info", {
        ov({String}, Int, "Set the equivalent of the `--vmodule` flag on the gateway node."),
    }, /*is_private=*/true);
    define(r, "crdb_internal.node_executable_version", kNormal, "System info", {
        ov({}, String, "Returns the version of the engine this node is running."),
    }, /*is_private=*/true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Aggregate and window functions
// ─────────────────────────────────────────────────────────────────────────────

void register_aggregate_functions(Registry& r) {
    define(r, "count", kAggregate, "", {
        ov({Any}, Int, "Calculates the number of selected elements."),
    });
    define(r, "count_rows", kAggregate, "", {
        ov({}, Int, "Calculates the number of rows."),
    });
    define(r, "sum", kAggregate, "", {
        ov({Int}, Decimal, "Calculates the sum of the selected values."),
        ov({Float}, Float, "Calculates the sum of the selected values."),
        ov({Decimal}, Decimal, "Calculates the sum of the selected values."),
        ov({Interval}, Interval, "Calculates the sum of the selected values."),
    });
    define(r, "avg", kAggregate, "", {
        ov({Int}, Decimal, "Calculates the average of the selected values."),
        ov({Float}, Float, "Calculates the average of the selected values."),
        ov({Decimal}, Decimal, "Calculates the average of the selected values."),
    });
    define(r, "min", kAggregate, "", {
        ov({Any}, std::nullopt, "Identifies the minimum selected value."),
    });
    define(r, "max", kAggregate, "", {
        ov({Any}, std::nullopt, "Identifies the maximum selected value."),
    });
    define(r, "bool_and", kAggregate, "", {
        ov({Bool}, Bool, "Calculates the boolean value of `AND`ing all selected values."),
    });
    define(r, "bool_or", kAggregate, "", {
        ov({Bool}, Bool, "Calculates the boolean value of `OR`ing all selected values."),
    });
    define(r, "string_agg", kAggregate, "", {
        ov({String, String}, String, "Concatenates all selected values using the provided delimiter."),
        ov({Bytes, Bytes}, Bytes, "Concatenates all selected values using the provided delimiter."),
    });
    define(r, "array_agg", kAggregate, "", {
        ov({Int}, IntArray, "Aggregates the selected values into an array."),
        ov({String}, StringArray, "Aggregates the selected values into an array."),
        ov({Bool}, BoolArray, "Aggregates the selected values into an array."),
    });
    define(r, "json_agg", kAggregate, "", {
        ov({Any}, Jsonb, "Aggregates values as a JSON or JSONB array."),
    });
    define(r, "stddev", kAggregate, "", {
        ov({Int}, Decimal, "Calculates the standard deviation of the selected values."),
        ov({Float}, Float, "Calculates the standard deviation of the selected values."),
        ov({Decimal}, Decimal, "Calculates the standard deviation of the selected values."),
    });
    define(r, "variance", kAggregate, "", {
        ov({Int}, Decimal, "Calculates the variance of the selected values."),
        ov({Float}, Float, "Calculates the variance of the selected values."),
        ov({Decimal}, Decimal, "Calculates the variance of the selected values."),
    });
    define(r, "xor_agg", kAggregate, "", {
        ov({Int}, Int, "Calculates the bitwise XOR of the selected values."),
        ov({Bytes}, Bytes, "Calculates the bitwise XOR of the selected values."),
    });
    define(r, "final_variance", kAggregate, "", {
        ov({Decimal, Decimal, Int}, Decimal, "Calculates the variance from the selected locally-computed squared difference values."),
    }, /*is_private=*/true);

    define(r, "row_number", kWindow, "", {
        ov({}, Int, "Calculates the number of the current row within its partition, counting from 1."),
    });
    define(r, "rank", kWindow, "", {
        ov({}, Int, "Calculates the rank of the current row with gaps."),
    });
    define(r, "dense_rank", kWindow, "", {
        ov({}, Int, "Calculates the rank of the current row without gaps."),
    });
    define(r, "percent_rank", kWindow, "", {
        ov({}, Float, "Calculates the relative rank of the current row."),
    });
    define(r, "cume_dist", kWindow, "", {
        ov({}, Float, "Calculates the relative rank of the current row."),
    });
    define(r, "ntile", kWindow, "", {
        ov({Int}, Int, "Calculates an integer ranging from 1 to `n`, dividing the partition as equally as possible."),
    });
    define(r, "lag", kWindow, "", {
        ov({Any}, std::nullopt, "Returns `val` evaluated at the previous row within current row's partition."),
        ov({Any, Int}, std::nullopt, "Returns `val` evaluated at the row that is `n` rows before the current row."),
    });
    define(r, "lead", kWindow, "", {
        ov({Any}, std::nullopt, "Returns `val` evaluated at the following row within current row's partition."),
        ov({Any, Int}, std::nullopt, "Returns `val` evaluated at the row that is `n` rows after the current row."),
    });
    define(r, "first_value", kWindow, "", {
        ov({Any}, std::nullopt, "Returns `val` evaluated at the row that is the first row of the window frame."),
    });
    define(r, "last_value", kWindow, "", {
        ov({Any}, std::nullopt, "Returns `val` evaluated at the row that is the last row of the window frame."),
    });
    define(r, "nth_value", kWindow, "", {
        ov({Any, Int}, std::nullopt, "Returns `val` evaluated at the row that is the `n`th row of the window frame."),
    });
}

// ─────────────────────────────────────────────────────────────────────────────
// Generators
// ─────────────────────────────────────────────────────────────────────────────

void register_generator_functions(Registry& r) {
    define(r, "generate_series", kGenerator, "Set-returning", {
        ov({Int, Int}, Int, "Produces a virtual table containing the integer values from `start` to `end`, inclusive."),
        ov({Int, Int, Int}, Int, "Produces a virtual table containing the integer values from `start` to `end`, inclusive, by increment of `step`."),
        ov({Timestamp, Timestamp, Interval}, Timestamp, "Produces a virtual table containing the timestamp values from `start` to `end`, inclusive, by increment of `step`."),
    });
    define(r, "unnest", kGenerator, "Set-returning", {
        ov({AnyArray}, std::nullopt, "Returns the input array as a set of rows."),
    });
    define(r, "jsonb_array_elements", kGenerator, "Set-returning", {
        ov({Jsonb}, Jsonb, "Expands a JSON array to a set of JSON values."),
    });
    define(r, "jsonb_object_keys", kGenerator, "Set-returning", {
        ov({Jsonb}, String, "Returns sorted set of keys in the outermost JSON object."),
    });
    define(r, "pg_get_keywords", kGenerator, "Compatibility", {
        ov({}, String, "Produces a virtual table containing the keywords known to the SQL parser."),
    });
}

}  // namespace

Registry Registry::with_builtins() {
    Registry registry;
    register_binary_operators(registry);
    register_scalar_functions(registry);
    register_aggregate_functions(registry);
    register_generator_functions(registry);
    return registry;
}

}  // namespace smither::sem
