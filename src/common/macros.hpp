#pragma once

/**
 * @file macros.hpp
 * @brief Utility macros for Smither
 */

#include <cstdlib>
#include <iostream>

namespace smither {

// ─────────────────────────────────────────────────────────────────────────────
// Assertion Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Assert that a condition is true (debug builds only)
 */
#ifdef NDEBUG
#define SMITHER_ASSERT(condition, message) ((void)0)
#else
#define SMITHER_ASSERT(condition, message)                                    \
    do {                                                                      \
        if (!(condition)) {                                                   \
            std::cerr << "Assertion failed: " << #condition << "\n"           \
                      << "Message: " << (message) << "\n"                     \
                      << "File: " << __FILE__ << "\n"                         \
                      << "Line: " << __LINE__ << std::endl;                   \
            std::abort();                                                     \
        }                                                                     \
    } while (false)
#endif

/**
 * @brief Mark code as unreachable
 */
#define SMITHER_UNREACHABLE()                                                 \
    do {                                                                      \
        std::cerr << "Unreachable code reached\n"                             \
                  << "File: " << __FILE__ << "\n"                             \
                  << "Line: " << __LINE__ << std::endl;                       \
        std::abort();                                                         \
    } while (false)

// ─────────────────────────────────────────────────────────────────────────────
// Utility Macros
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @brief Disable copy constructor and assignment
 */
#define SMITHER_DISALLOW_COPY(ClassName)           \
    ClassName(const ClassName&) = delete;          \
    ClassName& operator=(const ClassName&) = delete

/**
 * @brief Disable move constructor and assignment
 */
#define SMITHER_DISALLOW_MOVE(ClassName)           \
    ClassName(ClassName&&) = delete;               \
    ClassName& operator=(ClassName&&) = delete

/**
 * @brief Disable copy and move
 */
#define SMITHER_DISALLOW_COPY_AND_MOVE(ClassName)  \
    SMITHER_DISALLOW_COPY(ClassName);              \
    SMITHER_DISALLOW_MOVE(ClassName)

}  // namespace smither
