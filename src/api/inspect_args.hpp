#pragma once

/**
 * @file inspect_args.hpp
 * @brief Command-line options of smither_inspect
 */

#include <cstddef>
#include <string>
#include <vector>

#include "common/config.hpp"
#include "schema/schema_cache.hpp"
#include "smither/status.hpp"

namespace smither {

struct InspectArgs {
    std::string db_path;
    SchemaCacheOptions options;
    size_t picks = config::kDefaultInspectPicks;
    bool verbose = false;
    bool help = false;  ///< --help given; nothing else is meaningful
};

/**
 * @brief Parse the arguments following the program name
 *
 * The dialect is always SQLite. --seed and --picks take non-negative
 * decimal integers.
 *
 * @return Status::InvalidArgument for unknown flags, missing or malformed
 * values, and a missing database path
 */
[[nodiscard]] Status parse_inspect_args(const std::vector<std::string>& argv,
                                        InspectArgs* out);

}  // namespace smither
