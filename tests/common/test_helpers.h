#pragma once

#include <unistd.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/migration.h>

namespace mediarepo::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "mediarepo_test_") {
    static std::atomic<int> counter{0};
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" +
                         std::to_string(counter.fetch_add(1)));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

/**
 * @brief Temporary directory removed with the object
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "mediarepo_test_")
        : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Pool over a file database with the full schema applied
 */
inline std::shared_ptr<metadata::ConnectionPool>
open_migrated_pool(const std::filesystem::path& dbPath, size_t maxConnections = 8) {
    metadata::ConnectionPoolConfig config;
    config.maxConnections = maxConnections;
    auto pool = std::make_shared<metadata::ConnectionPool>(dbPath.string(), config);
    if (!pool->initialize()) {
        return nullptr;
    }
    auto migrated = pool->withConnection(
        [](metadata::Database& db) -> Result<void> { return metadata::migrateToLatest(db); });
    if (!migrated) {
        return nullptr;
    }
    return pool;
}

} // namespace mediarepo::tests
