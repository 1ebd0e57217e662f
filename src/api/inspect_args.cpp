/**
 * @file inspect_args.cpp
 * @brief smither_inspect argument parsing
 */

#include "api/inspect_args.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <string_view>

#include "common/status.hpp"

namespace smither {

namespace {

// from_chars takes no sign or whitespace, so "-1" and " 1" fail here.
Status parse_unsigned(std::string_view flag, std::string_view text, uint64_t max,
                      uint64_t* out) {
    uint64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (text.empty() || ec != std::errc() || ptr != end || value > max) {
        return Status::InvalidArgument(std::string(flag) + " expects a non-negative integer, got '" +
                                       std::string(text) + "'");
    }
    *out = value;
    return Status::Ok();
}

}  // namespace

Status parse_inspect_args(const std::vector<std::string>& argv, InspectArgs* out) {
    InspectArgs args;
    args.options.dialect = DialectKind::kSqlite;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& arg = argv[i];
        const bool takes_value = arg == "--schema" || arg == "--seed" || arg == "--picks";
        if (takes_value && i + 1 >= argv.size()) {
            return Status::InvalidArgument(arg + " requires a value");
        }

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            *out = std::move(args);
            return Status::Ok();
        } else if (arg == "--schema") {
            args.options.target_schema = argv[++i];
        } else if (arg == "--seed") {
            uint64_t seed = 0;
            SMITHER_RETURN_IF_ERROR(parse_unsigned(arg, argv[++i],
                                                   std::numeric_limits<uint64_t>::max(), &seed));
            args.options.seed = seed;
        } else if (arg == "--picks") {
            uint64_t picks = 0;
            SMITHER_RETURN_IF_ERROR(parse_unsigned(arg, argv[++i],
                                                   std::numeric_limits<size_t>::max(), &picks));
            args.picks = static_cast<size_t>(picks);
        } else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        } else if (!arg.empty() && arg[0] != '-' && args.db_path.empty()) {
            args.db_path = arg;
        } else {
            return Status::InvalidArgument("unknown argument: " + arg);
        }
    }

    if (args.db_path.empty()) {
        return Status::InvalidArgument("missing database path");
    }
    *out = std::move(args);
    return Status::Ok();
}

}  // namespace smither
