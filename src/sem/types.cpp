/**
 * @file types.cpp
 * @brief Type lookup tables and name resolution
 */

#include "sem/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <unordered_map>

#include "common/macros.hpp"

namespace smither::sem {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Type name lookup table
// ─────────────────────────────────────────────────────────────────────────────

const std::unordered_map<std::string, Type>& type_names() {
    static const std::unordered_map<std::string, Type> names = {
        {"BOOL", types::Bool},
        {"BOOLEAN", types::Bool},

        {"INT2", types::Int2},
        {"SMALLINT", types::Int2},
        {"INT4", types::Int4},
        {"INT8", types::Int},
        {"INT", types::Int},
        {"INTEGER", types::Int},
        {"BIGINT", types::Int},
        {"INT64", types::Int},

        {"FLOAT4", types::Float4},
        {"REAL", types::Float4},
        {"FLOAT8", types::Float},
        {"FLOAT", types::Float},
        {"DOUBLE", types::Float},
        {"DOUBLE PRECISION", types::Float},

        {"DECIMAL", types::Decimal},
        {"DEC", types::Decimal},
        {"NUMERIC", types::Decimal},

        {"STRING", types::String},
        {"TEXT", types::String},
        {"CHAR", types::String},
        {"CHARACTER", types::String},
        {"VARCHAR", types::VarChar},
        {"CHARACTER VARYING", types::VarChar},

        {"BYTES", types::Bytes},
        {"BYTEA", types::Bytes},
        {"BLOB", types::Bytes},

        {"DATE", types::Date},
        {"TIME", types::Time},
        {"TIME WITHOUT TIME ZONE", types::Time},
        {"TIMESTAMP", types::Timestamp},
        {"TIMESTAMP WITHOUT TIME ZONE", types::Timestamp},
        {"DATETIME", types::Timestamp},
        {"TIMESTAMPTZ", types::TimestampTZ},
        {"TIMESTAMP WITH TIME ZONE", types::TimestampTZ},
        {"INTERVAL", types::Interval},

        {"UUID", types::Uuid},
        {"JSONB", types::Jsonb},
        {"JSON", types::Jsonb},
        {"INET", types::INet},
        {"OID", types::Oid},

        {"TIMETZ", types::TimeTZ},
        {"TIME WITH TIME ZONE", types::TimeTZ},
        {"BIT", types::Bit},
        {"VARBIT", types::VarBit},
        {"BIT VARYING", types::VarBit},
        {"NAME", types::Name},
        {"\"CHAR\"", types::QChar},
    };
    return names;
}

/// Uppercase, drop "(...)" modifiers and collapse runs of whitespace.
std::string normalize_type_name(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    int depth = 0;
    bool pending_space = false;
    for (char c : name) {
        if (c == '(') {
            ++depth;
            continue;
        }
        if (c == ')') {
            if (depth > 0) --depth;
            continue;
        }
        if (depth > 0) continue;
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

}  // namespace

std::string_view to_string(TypeFamily family) noexcept {
    switch (family) {
        case TypeFamily::kUnknown:     return "unknown";
        case TypeFamily::kBool:        return "bool";
        case TypeFamily::kInt:         return "int";
        case TypeFamily::kFloat:       return "float";
        case TypeFamily::kDecimal:     return "decimal";
        case TypeFamily::kString:      return "string";
        case TypeFamily::kBytes:       return "bytes";
        case TypeFamily::kDate:        return "date";
        case TypeFamily::kTime:        return "time";
        case TypeFamily::kTimeTZ:      return "timetz";
        case TypeFamily::kTimestamp:   return "timestamp";
        case TypeFamily::kTimestampTZ: return "timestamptz";
        case TypeFamily::kInterval:    return "interval";
        case TypeFamily::kUuid:        return "uuid";
        case TypeFamily::kJson:        return "json";
        case TypeFamily::kINet:        return "inet";
        case TypeFamily::kOid:         return "oid";
        case TypeFamily::kBit:         return "bit";
        case TypeFamily::kArray:       return "array";
        case TypeFamily::kAny:         return "any";
    }
    SMITHER_UNREACHABLE();
}

bool is_non_array_family(const Type& type) noexcept {
    return std::any_of(types::kAnyNonArray.begin(), types::kAnyNonArray.end(),
                       [&](const Type& t) { return t.family() == type.family(); });
}

const Type* type_from_oid(oid_t oid) noexcept {
    for (const auto& t : types::kAll) {
        if (t.oid() == oid) {
            return &t;
        }
    }
    return nullptr;
}

Status type_from_name(std::string_view name, Type* out) {
    std::string key = normalize_type_name(name);

    bool is_array = false;
    if (key.size() > 2 && key.compare(key.size() - 2, 2, "[]") == 0) {
        is_array = true;
        key.resize(key.size() - 2);
        while (!key.empty() && key.back() == ' ') key.pop_back();
    }

    // Collated strings keep the type of their base name
    const size_t collate = key.find(" COLLATE ");
    if (collate != std::string::npos) {
        key.resize(collate);
    }

    const auto& names = type_names();
    auto it = names.find(key);
    if (it == names.end()) {
        return Status::Internal("unrecognized type name: " + std::string(name));
    }

    if (!is_array) {
        *out = it->second;
        return Status::Ok();
    }

    for (const auto& t : types::kAll) {
        if (t.is_array() && t.elem_oid() == it->second.oid()) {
            *out = t;
            return Status::Ok();
        }
    }
    return Status::Internal("no array type for element: " + std::string(name));
}

Status type_from_sqlite_declaration(std::string_view declared, Type* out) {
    if (type_from_name(declared, out).ok()) {
        return Status::Ok();
    }

    const std::string key = normalize_type_name(declared);
    auto contains = [&](std::string_view part) {
        return key.find(part) != std::string::npos;
    };

    if (contains("INT")) {
        *out = types::Int;
    } else if (contains("CHAR") || contains("CLOB") || contains("TEXT")) {
        *out = types::String;
    } else if (key.empty() || contains("BLOB")) {
        *out = types::Bytes;
    } else if (contains("REAL") || contains("FLOA") || contains("DOUB")) {
        *out = types::Float;
    } else {
        *out = types::Decimal;
    }
    return Status::Ok();
}

}  // namespace smither::sem
