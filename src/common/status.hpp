#pragma once

/**
 * @file status.hpp
 * @brief Internal status implementation
 *
 * This file re-exports the public status.hpp and adds internal utilities.
 */

#include "smither/status.hpp"

namespace smither {

/**
 * @brief Macro to return early if status is not OK
 */
#define SMITHER_RETURN_IF_ERROR(expr)   \
    do {                                \
        auto _status = (expr);          \
        if (!_status.ok()) {            \
            return _status;             \
        }                               \
    } while (false)

}  // namespace smither
