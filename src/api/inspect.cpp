/**
 * @file inspect.cpp
 * @brief Command-line tool printing what the schema layer discovers
 *
 * Usage: smither_inspect <db-path> [--schema S] [--seed N] [--picks N] [--verbose]
 */

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "api/inspect_args.hpp"
#include "catalog/static_catalogs.hpp"
#include "common/logger.hpp"
#include "schema/schema_cache.hpp"
#include "smither/smither.hpp"

namespace smither {

void print_usage() {
    std::cout << "smither_inspect v" << version() << "\n"
              << "Usage: smither_inspect <db-path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --schema <name>    Schema to discover (default: main)\n"
              << "  --seed <n>         Seed for random picks\n"
              << "  --picks <n>        Number of random picks to print\n"
              << "  --verbose          Debug logging\n";
}

void print_tables(const SchemaCache& cache) {
    for (const auto& table : cache.tables()) {
        std::cout << table.name().to_string() << "\n";
        for (const auto& column : table.columns()) {
            std::cout << "  " << std::setw(24) << std::left << column.name()
                      << std::setw(12) << column.type().name()
                      << (column.is_nullable() ? "NULL" : "NOT NULL")
                      << (column.is_computed() ? " COMPUTED" : "") << "\n";
        }
        for (const auto& [name, index] : cache.indexes_for(table.name())) {
            std::cout << "  " << index.to_sql() << "\n";
        }
    }
    std::cout << cache.table_count() << " table(s)\n";
}

void print_catalogs(const StaticCatalogs& catalogs) {
    std::cout << "\nOperators: " << catalogs.operators().size() << " overload(s)\n";
    for (const auto& [oid, entries] : catalogs.operators().by_return_type()) {
        const sem::Type* type = sem::type_from_oid(oid);
        std::cout << "  " << std::setw(16) << std::left
                  << (type != nullptr ? type->name() : "?") << entries.size() << "\n";
    }

    std::cout << "Functions: " << catalogs.functions().size() << " overload(s)\n";
    for (const auto& [cls, by_type] : catalogs.functions().by_class()) {
        size_t count = 0;
        for (const auto& [oid, entries] : by_type) {
            count += entries.size();
        }
        std::cout << "  " << std::setw(16) << std::left << sem::to_string(cls) << count << "\n";
    }
}

void print_picks(SchemaCache& cache, size_t picks) {
    std::cout << "\nRandom picks:\n";
    for (size_t i = 0; i < picks; ++i) {
        IndexPick pick = cache.pick_random_index();
        switch (pick.outcome) {
            case PickOutcome::kFound:
                std::cout << "  " << pick.name.to_string() << "\n";
                break;
            case PickOutcome::kNoTables:
                std::cout << "  (no tables)\n";
                return;
            case PickOutcome::kNoIndexes:
                std::cout << "  (table without indexes)\n";
                break;
        }
    }
}

}  // namespace smither

int main(int argc, char* argv[]) {
    smither::InspectArgs args;
    smither::Status status =
        smither::parse_inspect_args(std::vector<std::string>(argv + 1, argv + argc), &args);
    if (!status.ok()) {
        std::cerr << "Error: " << status.message() << "\n";
        smither::print_usage();
        return 2;
    }
    if (args.help) {
        smither::print_usage();
        return 0;
    }

    smither::Logger::set_level(args.verbose ? spdlog::level::debug : spdlog::level::warn);

    std::shared_ptr<smither::SqliteConnection> connection;
    status = smither::SqliteConnection::open(args.db_path, &connection);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }

    smither::SchemaCache cache(connection, args.options);
    status = cache.refresh();
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << std::endl;
        return 1;
    }

    auto registry = std::make_shared<const smither::sem::Registry>(
        smither::sem::Registry::with_builtins());
    auto catalogs = smither::StaticCatalogs::build(registry);

    smither::print_tables(cache);
    smither::print_catalogs(*catalogs);
    smither::print_picks(cache, args.picks);
    return 0;
}
