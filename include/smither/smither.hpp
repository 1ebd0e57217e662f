#pragma once

/**
 * @file smither.hpp
 * @brief Main include header for Smither
 *
 * Include this single header to access the public API of Smither.
 */

#include "smither/connection.hpp"
#include "smither/result.hpp"
#include "smither/sqlite_connection.hpp"
#include "smither/status.hpp"

namespace smither {

/**
 * @brief Get the version string of Smither
 * @return Version string in format "major.minor.patch"
 */
constexpr const char* version() noexcept {
    return "0.1.0";
}

}  // namespace smither
