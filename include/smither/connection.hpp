#pragma once

/**
 * @file connection.hpp
 * @brief Query capability consumed by the schema cache
 */

#include <string_view>

#include "smither/result.hpp"

namespace smither {

/**
 * @brief A live connection to the engine under test
 *
 * Smither only issues read-only introspection queries through this
 * interface. Timeouts and reconnection are the implementation's concern.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /**
     * @brief Run a query and materialize its rows
     * @return Result with rows, or an error Result carrying the engine status
     */
    [[nodiscard]] virtual Result query(std::string_view sql) = 0;
};

}  // namespace smither
