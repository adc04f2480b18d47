#include <spdlog/spdlog.h>
#include <algorithm>
#include <mediarepo/metadata/migration.h>

namespace mediarepo::metadata {

namespace {

using Millis = std::chrono::milliseconds;

Millis elapsedSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<Millis>(std::chrono::steady_clock::now() - start);
}

} // namespace

MigrationManager::MigrationManager(Database& db) : db_(db) {}

Result<void> MigrationManager::initialize() {
    return db_.execute(R"(
        CREATE TABLE IF NOT EXISTS migration_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            version INTEGER NOT NULL,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL,
            duration_ms INTEGER NOT NULL,
            success INTEGER NOT NULL,
            error TEXT
        )
    )");
}

void MigrationManager::registerMigrations(std::vector<Migration> migrations) {
    for (auto& migration : migrations) {
        migrations_.push_back(std::move(migration));
    }
    std::sort(migrations_.begin(), migrations_.end(),
              [](const Migration& a, const Migration& b) { return a.version < b.version; });
}

Result<int> MigrationManager::getCurrentVersion() {
    MEDIAREPO_TRY_UNWRAP(stmt,
                         db_.prepare("SELECT MAX(version) FROM migration_history WHERE success = 1"));
    MEDIAREPO_TRY_UNWRAP(hasRow, stmt.step());
    if (!hasRow || stmt.isNull(0)) {
        return 0;
    }
    return stmt.getInt(0);
}

int MigrationManager::getLatestVersion() const {
    return migrations_.empty() ? 0 : migrations_.back().version;
}

Result<bool> MigrationManager::needsMigration() {
    MEDIAREPO_TRY_UNWRAP(current, getCurrentVersion());
    return current < getLatestVersion();
}

Result<void> MigrationManager::migrate() {
    MEDIAREPO_TRY_UNWRAP(current, getCurrentVersion());

    for (const auto& migration : migrations_) {
        if (migration.version <= current) {
            continue;
        }

        auto start = std::chrono::steady_clock::now();
        auto result = apply(migration);
        if (!result) {
            spdlog::error("Schema migration {} '{}' failed: {}", migration.version,
                          migration.name, result.error().message);
            auto recorded = record(migration, elapsedSince(start), result.error().message);
            if (!recorded) {
                spdlog::warn("Could not record failed migration {}: {}", migration.version,
                             recorded.error().message);
            }
            return result;
        }
        spdlog::debug("Schema migration {} '{}' applied", migration.version, migration.name);
        current = migration.version;
    }
    return {};
}

Result<std::vector<MigrationHistory>> MigrationManager::getHistory() {
    MEDIAREPO_TRY_UNWRAP(stmt,
                         db_.prepare("SELECT version, name, applied_at, duration_ms, success, "
                                     "IFNULL(error, '') FROM migration_history ORDER BY id"));
    std::vector<MigrationHistory> history;
    while (true) {
        MEDIAREPO_TRY_UNWRAP(hasRow, stmt.step());
        if (!hasRow)
            break;
        history.push_back(MigrationHistory{stmt.getInt(0), stmt.getString(1),
                                           fromUnixSeconds(stmt.getInt64(2)),
                                           Millis(stmt.getInt64(3)), stmt.getInt(4) != 0,
                                           stmt.getString(5)});
    }
    return history;
}

Result<void> MigrationManager::apply(const Migration& migration) {
    auto start = std::chrono::steady_clock::now();
    return db_.transaction(
        [&]() -> Result<void> {
            // Another connection may have migrated while we waited for the write lock
            MEDIAREPO_TRY_UNWRAP(current, getCurrentVersion());
            if (current >= migration.version) {
                return {};
            }
            MEDIAREPO_TRY(db_.execute(migration.sql));
            return record(migration, elapsedSince(start), {});
        },
        TransactionMode::Immediate);
}

Result<void> MigrationManager::record(const Migration& migration, Millis duration,
                                      const std::string& error) {
    MEDIAREPO_TRY_UNWRAP(stmt, db_.prepare("INSERT INTO migration_history "
                                           "(version, name, applied_at, duration_ms, success, error) "
                                           "VALUES (?, ?, ?, ?, ?, ?)"));
    std::optional<std::string> errorText;
    if (!error.empty()) {
        errorText = error;
    }
    MEDIAREPO_TRY(stmt.bindAll(migration.version, migration.name,
                               toUnixSeconds(std::chrono::system_clock::now()), duration.count(),
                               error.empty() ? 1 : 0, errorText));
    return stmt.execute();
}

const std::vector<Migration>& schemaMigrations() {
    static const std::vector<Migration> migrations = {
        {1, "Create content schema", R"(
            CREATE TABLE storage_locations (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE,
                path TEXT NOT NULL UNIQUE
            );

            CREATE TABLE content_descriptors (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                hash TEXT NOT NULL UNIQUE
            );

            CREATE TABLE files (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                cd_id INTEGER NOT NULL REFERENCES content_descriptors(id),
                storage_id INTEGER NOT NULL REFERENCES storage_locations(id),
                status INTEGER NOT NULL DEFAULT 0,
                file_type INTEGER NOT NULL DEFAULT 0,
                mime_type TEXT,
                name TEXT,
                comment TEXT,
                size INTEGER NOT NULL DEFAULT 0,
                creation_time INTEGER NOT NULL,
                change_time INTEGER NOT NULL,
                import_time INTEGER NOT NULL
            );
        )"},
        // Tag identity is (namespace or none, name). UNIQUE(namespace_id, name) alone would
        // not catch duplicates without a namespace because NULLs compare distinct.
        {2, "Create tag schema", R"(
            CREATE TABLE namespaces (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                name TEXT NOT NULL UNIQUE
            );

            CREATE TABLE tags (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                namespace_id INTEGER REFERENCES namespaces(id),
                name TEXT NOT NULL
            );

            CREATE UNIQUE INDEX idx_tags_identity ON tags(IFNULL(namespace_id, 0), name);

            CREATE TABLE file_tags (
                file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
                tag_id INTEGER NOT NULL REFERENCES tags(id) ON DELETE CASCADE,
                PRIMARY KEY (file_id, tag_id)
            );
        )"},
        {3, "Create thumbnail schema", R"(
            CREATE TABLE thumbnails (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
                cd_id INTEGER NOT NULL REFERENCES content_descriptors(id),
                storage_id INTEGER NOT NULL REFERENCES storage_locations(id),
                height INTEGER NOT NULL,
                width INTEGER NOT NULL,
                mime_type TEXT NOT NULL
            );
        )"},
        {4, "Create lookup indexes", R"(
            CREATE INDEX idx_files_cd ON files(cd_id);
            CREATE INDEX idx_files_import_time ON files(import_time);
            CREATE INDEX idx_file_tags_tag ON file_tags(tag_id);
            CREATE INDEX idx_thumbnails_file ON thumbnails(file_id);
            CREATE INDEX idx_thumbnails_cd ON thumbnails(cd_id);
        )"},
        {5, "Record thumbnail size tier", R"(
            ALTER TABLE thumbnails ADD COLUMN size_tier TEXT;
            CREATE INDEX idx_thumbnails_tier ON thumbnails(file_id, size_tier);
        )"},
    };
    return migrations;
}

Result<void> migrateToLatest(Database& db) {
    MigrationManager manager(db);
    MEDIAREPO_TRY(manager.initialize());
    manager.registerMigrations(schemaMigrations());
    return manager.migrate();
}

} // namespace mediarepo::metadata
