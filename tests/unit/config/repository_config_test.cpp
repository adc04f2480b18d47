#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <mediarepo/config/config_helpers.h>
#include <mediarepo/config/repository_config.h>
#include "../../common/test_helpers.h"

using namespace mediarepo;
using namespace mediarepo::config;

TEST(RepositoryConfigTest, ParsesFullDocument) {
    std::istringstream in(R"(
# media repository
[repository]
database = "/srv/media/repo.db"
main_storage = "default"
thumbnail_storage = 'thumbs'   # quoted either way

[storage.default]
path = "/srv/media/files"

[storage.thumbs]
path = /srv/media/thumbnails

[buffer]
ttl_seconds = 45
oneshot_max_age_seconds = 120
sweep_interval_seconds = 5

[database]
max_connections = 4
busy_timeout_ms = 2500

[logging]
level = "debug"
)");

    auto config = parseRepositoryConfig(in);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    const auto& c = config.value();
    EXPECT_EQ(c.databasePath, std::filesystem::path("/srv/media/repo.db"));
    ASSERT_EQ(c.storages.size(), 2u);
    EXPECT_EQ(c.storages[0].name, "default");
    EXPECT_EQ(c.storages[0].path, std::filesystem::path("/srv/media/files"));
    EXPECT_EQ(c.storages[1].name, "thumbs");
    EXPECT_EQ(c.storages[1].path, std::filesystem::path("/srv/media/thumbnails"));
    EXPECT_EQ(c.mainStorage, std::optional<std::string>("default"));
    EXPECT_EQ(c.thumbnailStorage, std::optional<std::string>("thumbs"));
    EXPECT_EQ(c.buffer.ttl, std::chrono::seconds(45));
    EXPECT_EQ(c.buffer.oneShotMaxAge, std::chrono::seconds(120));
    EXPECT_EQ(c.buffer.sweepInterval, std::chrono::seconds(5));
    EXPECT_EQ(c.maxConnections, 4u);
    EXPECT_EQ(c.busyTimeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(c.logLevel, "debug");
}

TEST(RepositoryConfigTest, DefaultsWhenEmpty) {
    std::istringstream in("");
    auto config = parseRepositoryConfig(in);
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config.value().storages.empty());
    EXPECT_FALSE(config.value().mainStorage.has_value());
    EXPECT_EQ(config.value().buffer.ttl, std::chrono::seconds(30));
    EXPECT_EQ(config.value().buffer.oneShotMaxAge, std::chrono::seconds(300));
    EXPECT_EQ(config.value().buffer.sweepInterval, std::chrono::seconds(10));
    EXPECT_EQ(config.value().maxConnections, 8u);
    EXPECT_EQ(config.value().databasePath.filename(), "repo.db");
}

TEST(RepositoryConfigTest, RelativePathsResolveAgainstBaseDir) {
    std::istringstream in(R"(
[repository]
database = "repo.db"

[storage.default]
path = "files"
)");
    auto config = parseRepositoryConfig(in, "/etc/mediarepo");
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config.value().databasePath, std::filesystem::path("/etc/mediarepo/repo.db"));
    EXPECT_EQ(config.value().storages[0].path, std::filesystem::path("/etc/mediarepo/files"));
}

TEST(RepositoryConfigTest, RejectsInvalidNumbers) {
    for (const char* doc : {"[buffer]\nttl_seconds = 0\n", "[buffer]\nttl_seconds = -5\n",
                            "[database]\nmax_connections = many\n",
                            "[database]\nbusy_timeout_ms = 10ms\n"}) {
        std::istringstream in(doc);
        auto config = parseRepositoryConfig(in);
        ASSERT_FALSE(config.has_value()) << doc;
        EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
    }
}

TEST(RepositoryConfigTest, RejectsUndefinedStorageSelection) {
    std::istringstream in(R"(
[repository]
main_storage = "missing"

[storage.default]
path = "/tmp/files"
)");
    auto config = parseRepositoryConfig(in);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST(RepositoryConfigTest, RejectsStorageWithoutPath) {
    std::istringstream in("[storage.default]\nname = \"x\"\n");
    auto config = parseRepositoryConfig(in);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().code, ErrorCode::InvalidArgument);
}

TEST(RepositoryConfigTest, LoadFromFile) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "config.toml",
                                  "[storage.default]\npath = \"files\"\n"
                                  "[repository]\nmain_storage = \"default\"\n");
    auto config = loadRepositoryConfig(path);
    ASSERT_TRUE(config.has_value()) << config.error().message;
    ASSERT_EQ(config.value().storages.size(), 1u);
    EXPECT_EQ(config.value().storages[0].path, dir.path() / "files");

    auto missing = loadRepositoryConfig(dir / "absent.toml");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);
}

TEST(RepositoryConfigTest, ConfigureLogging) {
    auto previous = spdlog::get_level();

    ASSERT_TRUE(configureLogging("debug").has_value());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
    ASSERT_TRUE(configureLogging("off").has_value());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);

    auto invalid = configureLogging("chatty");
    ASSERT_FALSE(invalid.has_value());
    EXPECT_EQ(invalid.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(spdlog::get_level(), spdlog::level::off);

    spdlog::set_level(previous);
}

TEST(ConfigHelpersTest, UnquoteAndTrim) {
    EXPECT_EQ(unquote("  \"value\"  "), "value");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
    EXPECT_EQ(unquote("\"mismatched'"), "\"mismatched'");
}

TEST(ConfigHelpersTest, ExpandTilde) {
    const char* home = std::getenv("HOME");
    if (!home) {
        GTEST_SKIP() << "HOME not set";
    }
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path(home));
    EXPECT_EQ(expand_tilde("~/media"), std::filesystem::path(home) / "media");
    EXPECT_EQ(expand_tilde("~other/media"), std::filesystem::path("~other/media"));
    EXPECT_EQ(expand_tilde("/abs"), std::filesystem::path("/abs"));
}

TEST(ConfigHelpersTest, SectionsAndInlineComments) {
    std::istringstream in(R"(
top = 1
[a]
key = "has # inside"   # trailing
other = plain # trailing
)");
    auto sections = parse_config_sections(in);
    EXPECT_EQ(sections[""]["top"], "1");
    EXPECT_EQ(sections["a"]["key"], "has # inside");
    EXPECT_EQ(sections["a"]["other"], "plain");
}

namespace {

// Sets or unsets an environment variable for the scope, restoring the previous value
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = std::string(old);
        }
        if (value) {
            ::setenv(name, value, 1);
        } else {
            ::unsetenv(name);
        }
    }
    ~ScopedEnv() {
        if (previous_) {
            ::setenv(name_, previous_->c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::optional<std::string> previous_;
};

} // namespace

TEST(ConfigDiscoveryTest, EnvironmentOverrideWins) {
    tests::TempDir dir;
    auto path = tests::write_file(dir / "custom.toml", "[logging]\nlevel = \"warn\"\n");
    ScopedEnv config("MEDIAREPO_CONFIG", path.c_str());

    EXPECT_EQ(get_config_path(), path);
    EXPECT_EQ(get_config_path("/explicit.toml"), std::filesystem::path("/explicit.toml"));

    auto loaded = loadRepositoryConfig();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().logLevel, "warn");
}

TEST(ConfigDiscoveryTest, FallsBackToXdgConfigHome) {
    tests::TempDir dir;
    tests::write_file(dir / "mediarepo" / "config.toml",
                      "[database]\nmax_connections = 3\n");
    ScopedEnv config("MEDIAREPO_CONFIG", nullptr);
    ScopedEnv xdg("XDG_CONFIG_HOME", dir.path().c_str());

    EXPECT_EQ(get_config_dir(), dir.path() / "mediarepo");
    auto loaded = loadRepositoryConfig();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().maxConnections, 3u);
}

TEST(ConfigDiscoveryTest, MissingFileGivesDefaults) {
    tests::TempDir dir;
    ScopedEnv config("MEDIAREPO_CONFIG", (dir / "absent.toml").c_str());
    ScopedEnv data("XDG_DATA_HOME", dir.path().c_str());

    auto loaded = loadRepositoryConfig();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().databasePath, dir.path() / "mediarepo" / "repo.db");
    EXPECT_EQ(loaded.value().buffer.ttl, std::chrono::seconds(30));
    EXPECT_FALSE(loaded.value().mainStorage.has_value());
}
