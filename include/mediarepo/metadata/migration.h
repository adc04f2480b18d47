#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <mediarepo/metadata/database.h>

namespace mediarepo::metadata {

struct Migration {
    int version = 0;
    std::string name;
    std::string sql;
};

struct MigrationHistory {
    int version = 0;
    std::string name;
    TimePoint appliedAt;
    std::chrono::milliseconds duration{0};
    bool success = false;
    std::string error;
};

/**
 * @brief Forward-only schema migrations recorded in migration_history
 *
 * Each step runs in a BEGIN IMMEDIATE transaction and re-checks the current version inside
 * it, so several connections opening the same file apply every step once.
 */
class MigrationManager {
public:
    explicit MigrationManager(Database& db);

    // Create the history table
    Result<void> initialize();

    void registerMigrations(std::vector<Migration> migrations);

    Result<int> getCurrentVersion();
    int getLatestVersion() const;
    Result<bool> needsMigration();

    Result<void> migrate();

    Result<std::vector<MigrationHistory>> getHistory();

private:
    Database& db_;
    std::vector<Migration> migrations_; // sorted by version

    Result<void> apply(const Migration& migration);
    Result<void> record(const Migration& migration, std::chrono::milliseconds duration,
                        const std::string& error);
};

// Media repository schema, version 1 upwards
const std::vector<Migration>& schemaMigrations();

/**
 * @brief Create the history table and apply every pending schema migration
 */
Result<void> migrateToLatest(Database& db);

} // namespace mediarepo::metadata
