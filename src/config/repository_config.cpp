#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <mediarepo/config/config_helpers.h>
#include <mediarepo/config/repository_config.h>

namespace mediarepo::config {

namespace {

constexpr std::string_view STORAGE_SECTION_PREFIX = "storage.";

Result<int64_t> parsePositive(const std::string& section, const std::string& key,
                              const std::string& value) {
    int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc{} || ptr != value.data() + value.size() || parsed <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("[{}] {} must be a positive integer, got '{}'", section, key,
                                 value)};
    }
    return parsed;
}

std::filesystem::path resolvePath(const std::string& raw, const std::filesystem::path& baseDir) {
    auto path = expand_tilde(raw);
    if (path.is_relative() && !baseDir.empty()) {
        return baseDir / path;
    }
    return path;
}

const std::string* lookup(const ConfigSections& sections, const std::string& section,
                          const std::string& key) {
    auto sit = sections.find(section);
    if (sit == sections.end())
        return nullptr;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? nullptr : &kit->second;
}

bool hasStorage(const RepositoryConfig& config, const std::string& name) {
    for (const auto& storage : config.storages) {
        if (storage.name == name)
            return true;
    }
    return false;
}

} // namespace

RepositoryConfig defaultRepositoryConfig() {
    RepositoryConfig config;
    config.databasePath = get_data_dir() / "repo.db";
    return config;
}

Result<RepositoryConfig> parseRepositoryConfig(std::istream& in,
                                               const std::filesystem::path& baseDir) {
    auto sections = parse_config_sections(in);
    RepositoryConfig config = defaultRepositoryConfig();

    if (auto* db = lookup(sections, "repository", "database"); db && !db->empty()) {
        config.databasePath = resolvePath(*db, baseDir);
    }

    for (const auto& [section, values] : sections) {
        if (section.rfind(STORAGE_SECTION_PREFIX, 0) != 0)
            continue;

        std::string name = section.substr(STORAGE_SECTION_PREFIX.size());
        auto it = values.find("path");
        if (name.empty() || it == values.end() || it->second.empty()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("[{}] needs a storage name and a path", section)};
        }
        config.storages.push_back(StorageConfig{name, resolvePath(it->second, baseDir)});
    }

    if (auto* main = lookup(sections, "repository", "main_storage"); main && !main->empty()) {
        config.mainStorage = *main;
    }
    if (auto* thumbs = lookup(sections, "repository", "thumbnail_storage");
        thumbs && !thumbs->empty()) {
        config.thumbnailStorage = *thumbs;
    }
    for (const auto* selected : {&config.mainStorage, &config.thumbnailStorage}) {
        if (*selected && !hasStorage(config, **selected)) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("Storage '{}' is selected but not defined", **selected)};
        }
    }

    struct SecondsKey {
        const char* key;
        std::chrono::milliseconds* target;
    };
    for (auto [key, target] : {SecondsKey{"ttl_seconds", &config.buffer.ttl},
                               SecondsKey{"oneshot_max_age_seconds", &config.buffer.oneShotMaxAge},
                               SecondsKey{"sweep_interval_seconds", &config.buffer.sweepInterval}}) {
        if (auto* raw = lookup(sections, "buffer", key)) {
            MEDIAREPO_TRY_UNWRAP(seconds, parsePositive("buffer", key, *raw));
            *target = std::chrono::seconds{seconds};
        }
    }

    if (auto* raw = lookup(sections, "database", "max_connections")) {
        MEDIAREPO_TRY_UNWRAP(maxConnections, parsePositive("database", "max_connections", *raw));
        config.maxConnections = static_cast<size_t>(maxConnections);
    }
    if (auto* raw = lookup(sections, "database", "busy_timeout_ms")) {
        MEDIAREPO_TRY_UNWRAP(busyTimeout, parsePositive("database", "busy_timeout_ms", *raw));
        config.busyTimeout = std::chrono::milliseconds{busyTimeout};
    }

    if (auto* level = lookup(sections, "logging", "level"); level && !level->empty()) {
        config.logLevel = *level;
    }

    return config;
}

Result<RepositoryConfig> loadRepositoryConfig(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + path.string()};
    }
    return parseRepositoryConfig(file, path.parent_path());
}

Result<RepositoryConfig> loadRepositoryConfig() {
    auto path = get_config_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at {}, using defaults", path.string());
        return defaultRepositoryConfig();
    }
    spdlog::info("Loading config from {}", path.string());
    return loadRepositoryConfig(path);
}

Result<void> configureLogging(std::string_view level) {
    auto parsed = spdlog::level::from_str(std::string(level));
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return Error{ErrorCode::InvalidArgument, fmt::format("Unknown log level '{}'", level)};
    }
    spdlog::set_level(parsed);
    return {};
}

} // namespace mediarepo::config
