/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the Smither schema layer
 */

#include <iostream>

#include <smither/smither.hpp>

#include "catalog/static_catalogs.hpp"
#include "schema/schema_cache.hpp"

int main() {
    std::cout << "Smither v" << smither::version() << "\n\n";

    // Open an in-memory database and give it something to discover
    std::shared_ptr<smither::SqliteConnection> conn;
    auto status = smither::SqliteConnection::open(":memory:", &conn);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << "\n";
        return 1;
    }

    status = conn->execute(
        "CREATE TABLE users (id INTEGER PRIMARY KEY, name TEXT NOT NULL, age INT);"
        "CREATE INDEX users_name ON users (name DESC);");
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << "\n";
        return 1;
    }

    // Discover the schema
    smither::SchemaCacheOptions options;
    options.dialect = smither::DialectKind::kSqlite;
    smither::SchemaCache cache(conn, options);

    status = cache.refresh();
    std::cout << "Refresh: " << status.to_string() << "\n";
    if (!status.ok()) {
        return 1;
    }

    if (auto table = cache.pick_random_table()) {
        std::cout << "Picked table " << table->name().to_string() << " with "
                  << table->column_count() << " column(s)\n";
    }

    auto pick = cache.pick_random_index();
    if (pick.found()) {
        std::cout << "Picked index " << pick.name.to_string() << ": "
                  << pick.index.to_sql() << "\n";
    }

    // Catalogs are built once and shared
    auto catalogs = smither::StaticCatalogs::build(
        std::make_shared<const smither::sem::Registry>(smither::sem::Registry::with_builtins()));
    const auto& string_ops = catalogs->operators().returning(smither::sem::types::String.oid());
    std::cout << "\nOperators returning STRING: " << string_ops.size() << "\n";
    for (const auto& entry : string_ops) {
        std::cout << "  " << entry.overload->left_type.name() << " "
                  << smither::sem::to_string(entry.op) << " "
                  << entry.overload->right_type.name() << "\n";
    }

    return 0;
}
