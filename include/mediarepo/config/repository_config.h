#pragma once

#include <chrono>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <mediarepo/core/types.h>

namespace mediarepo::config {

struct StorageConfig {
    std::string name;
    std::filesystem::path path;
};

// Read from whole seconds in [buffer]
struct BufferConfig {
    std::chrono::milliseconds ttl{std::chrono::seconds{30}};
    std::chrono::milliseconds oneShotMaxAge{std::chrono::seconds{300}};
    std::chrono::milliseconds sweepInterval{std::chrono::seconds{10}};
};

/**
 * @brief Everything needed to open a repository
 */
struct RepositoryConfig {
    std::filesystem::path databasePath;
    std::vector<StorageConfig> storages; ///< Registered (find-or-create) on open
    std::optional<std::string> mainStorage;
    std::optional<std::string> thumbnailStorage;
    BufferConfig buffer;
    size_t maxConnections = 8;
    std::chrono::milliseconds busyTimeout{5000};
    std::string logLevel = "info";
};

/**
 * @brief Parse a config document
 *
 * Relative paths are resolved against baseDir when it is set. Numbers must be positive
 * integers; main/thumbnail storage names must refer to a [storage.<name>] section.
 */
Result<RepositoryConfig> parseRepositoryConfig(std::istream& in,
                                               const std::filesystem::path& baseDir = {});

Result<RepositoryConfig> loadRepositoryConfig(const std::filesystem::path& path);

/**
 * @brief Load the config found by get_config_path(); defaults when no file exists there
 */
Result<RepositoryConfig> loadRepositoryConfig();

/**
 * @brief Defaults under the user data directory
 */
RepositoryConfig defaultRepositoryConfig();

/**
 * @brief Set the spdlog level from its name ("trace" ... "off")
 */
Result<void> configureLogging(std::string_view level);

} // namespace mediarepo::config
