#pragma once

/**
 * @file config.hpp
 * @brief Configuration constants for Smither
 */

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace smither {
namespace config {

// ─────────────────────────────────────────────────────────────────────────────
// Schema Discovery
// ─────────────────────────────────────────────────────────────────────────────

/// Schema the cache is scoped to on CockroachDB / PostgreSQL-like engines
constexpr std::string_view kDefaultTargetSchema = "public";

/// Schema name reported for the main database by the SQLite dialect
constexpr std::string_view kSqliteMainSchema = "main";

/// Seed for the cache's random engine when none is given
constexpr uint64_t kDefaultSeed = 0x5eed5eed5eedULL;

// ─────────────────────────────────────────────────────────────────────────────
// Function Catalog Filters
// ─────────────────────────────────────────────────────────────────────────────

/// Functions that stall the connection and are never generated
constexpr std::string_view kSleepFunctionName = "pg_sleep";

/// Name fragment of internal functions that force panics, errors or retries
constexpr std::string_view kForceFunctionMarker = "crdb_internal.force_";

/// Category of partially implemented compatibility shims
constexpr std::string_view kCompatibilityCategory = "Compatibility";

/// Marker in an overload's info string documenting it as broken
constexpr std::string_view kUnusableOverloadMarker = "Not usable";

// ─────────────────────────────────────────────────────────────────────────────
// Inspect Tool
// ─────────────────────────────────────────────────────────────────────────────

/// Random picks printed by smither_inspect unless --picks is given
constexpr size_t kDefaultInspectPicks = 5;

}  // namespace config
}  // namespace smither
