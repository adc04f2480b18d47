#pragma once

#include <gtest/gtest.h>
#include <memory>
#include <mediarepo/api/repository.h>
#include "fake_renderer.h"
#include "test_helpers.h"

namespace mediarepo::tests {

inline config::RepositoryConfig make_repository_config(const std::filesystem::path& root,
                                                       bool withThumbnails = true) {
    config::RepositoryConfig config;
    config.databasePath = root / "repo.db";
    config.storages.push_back({"default", root / "files"});
    config.mainStorage = "default";
    if (withThumbnails) {
        config.storages.push_back({"thumbnails", root / "thumbnails"});
        config.thumbnailStorage = "thumbnails";
    }
    return config;
}

/**
 * @brief Fixture with an opened repository on a temporary directory
 */
class RepositoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        renderer_ = std::make_shared<FakeRenderer>();
        auto repo = api::Repository::open(make_repository_config(dir_.path()), renderer_);
        ASSERT_TRUE(repo.has_value()) << repo.error().message;
        repo_ = std::move(repo).value();
    }

    TempDir dir_;
    std::shared_ptr<FakeRenderer> renderer_;
    std::unique_ptr<api::Repository> repo_;
};

} // namespace mediarepo::tests
