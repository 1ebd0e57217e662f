#pragma once

/**
 * @file types.hpp
 * @brief Common type definitions for Smither
 */

#include <cstddef>
#include <cstdint>

namespace smither {

// ─────────────────────────────────────────────────────────────────────────────
// Basic Type Aliases
// ─────────────────────────────────────────────────────────────────────────────

/// Object identifier of a SQL type, as reported by the engine's catalog
using oid_t = uint32_t;

// ─────────────────────────────────────────────────────────────────────────────
// Invalid/Sentinel Values
// ─────────────────────────────────────────────────────────────────────────────

/// Invalid OID
constexpr oid_t INVALID_OID = 0;

}  // namespace smither
