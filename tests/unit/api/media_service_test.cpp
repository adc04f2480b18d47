#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <boost/asio/io_context.hpp>
#include <mediarepo/api/media_service.h>
#include "../../common/repository_fixture.h"

using namespace mediarepo;
using namespace mediarepo::api;

namespace {

constexpr const char* HELLO_HASH =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";

} // namespace

class MediaServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        renderer_ = std::make_shared<tests::FakeRenderer>();
        service_ = std::make_unique<MediaService>(renderer_);
        auto connected = service_->connect(tests::make_repository_config(dir_.path()));
        ASSERT_TRUE(connected.has_value()) << connected.error().message;
    }

    metadata::FileInfo addFile(const std::string& mime, const std::string& content) {
        auto now = std::chrono::system_clock::now();
        auto file = service_->connectionState()->with(
            [&](Repository& repo) { return repo.addFile(mime, toBytes(content), now, now); });
        EXPECT_TRUE(file.has_value());
        return file.value();
    }

    tests::TempDir dir_;
    std::shared_ptr<tests::FakeRenderer> renderer_;
    std::unique_ptr<MediaService> service_;
};

TEST_F(MediaServiceTest, UnknownKeysAreNotFound) {
    EXPECT_EQ(service_->fetch("once://deadbeef").status, 404);
    EXPECT_EQ(service_->fetch("content://deadbeef").status, 404);
    EXPECT_EQ(service_->fetch("thumb://deadbeef?height=100&width=100").status, 404);
    EXPECT_EQ(service_->fetch("ftp://deadbeef").status, 404);

    auto response = service_->fetch("once://deadbeef");
    EXPECT_EQ(response.mimeType, "text/plain");
    EXPECT_NE(toString(response.bytes).find("deadbeef"), std::string::npos);
}

TEST_F(MediaServiceTest, ReadFileByHashIsFetchableOnce) {
    auto file = addFile("text/plain", "hello");
    ASSERT_EQ(file.descriptor.hash, HELLO_HASH);

    auto key = service_->readFileByHash(HELLO_HASH, "text/plain");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key.value(), std::string("once://") + HELLO_HASH);

    auto first = service_->fetch(key.value());
    EXPECT_EQ(first.status, 200);
    EXPECT_EQ(first.mimeType, "text/plain");
    EXPECT_EQ(toString(first.bytes), "hello");

    EXPECT_EQ(service_->fetch(key.value()).status, 404);
    EXPECT_EQ(service_->buffers()->size(), 0u);
}

TEST_F(MediaServiceTest, ReadFileByUnknownHash) {
    auto key = service_->readFileByHash("ffff", "text/plain");
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error().code, ErrorCode::NotFound);
}

TEST_F(MediaServiceTest, FetchContentStagesPersistentBuffer) {
    addFile("text/plain", "hello");

    auto response = service_->fetch(std::string("content://") + HELLO_HASH);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.mimeType, "text/plain");
    EXPECT_EQ(toString(response.bytes), "hello");

    ASSERT_TRUE(service_->buffers()->contains(HELLO_HASH));
    EXPECT_EQ(service_->fetchContent(HELLO_HASH).status, 200);
    EXPECT_TRUE(service_->buffers()->contains(HELLO_HASH));
}

TEST_F(MediaServiceTest, FetchThumbnailRendersOnceAndBuffers) {
    auto file = addFile("image/png", "picture");

    auto uri = fmt::format("thumb://{}?height=100&width=100", file.descriptor.hash);
    auto response = service_->fetch(uri);
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(response.mimeType, "image/png");
    EXPECT_EQ(toString(response.bytes), "png:128x128:7");
    EXPECT_EQ(renderer_->renderCount(), 1);
    EXPECT_TRUE(service_->buffers()->contains(uri));

    service_->buffers()->clear();
    auto again = service_->fetchThumbnail(file.descriptor.hash, 110, 110);
    EXPECT_EQ(again.status, 200);
    EXPECT_EQ(renderer_->renderCount(), 1);

    service_->buffers()->clear();
    EXPECT_EQ(service_->fetch(uri).status, 200);
    EXPECT_EQ(renderer_->renderCount(), 1);
}

TEST_F(MediaServiceTest, ThumbnailQueryFallsBackToDefaultEdge) {
    auto file = addFile("image/png", "picture");

    auto response = service_->fetch(fmt::format("thumb://{}?height=abc", file.descriptor.hash));
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(toString(response.bytes), "png:256x256:7");
    EXPECT_TRUE(service_->buffers()->contains(
        MediaService::thumbnailKey(file.descriptor.hash, 250, 250)));

    service_->buffers()->clear();
    auto zero = service_->fetch(fmt::format("thumb://{}?height=0&width=0", file.descriptor.hash));
    ASSERT_EQ(zero.status, 200);
    EXPECT_EQ(toString(zero.bytes), "png:256x256:7");
    EXPECT_EQ(renderer_->renderCount(), 1);
}

TEST_F(MediaServiceTest, RenderFailureIsServerError) {
    auto file = addFile("image/png", "broken");
    renderer_->setFailing(true);

    auto response = service_->fetchThumbnail(file.descriptor.hash);
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(service_->buffers()->size(), 0u);
}

TEST_F(MediaServiceTest, GetFileThumbnailsCreatesDefaultTier) {
    auto file = addFile("image/png", "picture");

    auto thumbs = service_->getFileThumbnails(file.descriptor.hash);
    ASSERT_TRUE(thumbs.has_value()) << thumbs.error().message;
    ASSERT_EQ(thumbs.value().size(), 1u);
    EXPECT_EQ(thumbs.value()[0].height, 256u);
    EXPECT_NE(thumbs.value()[0].fileHash, file.descriptor.hash);

    auto again = service_->getFileThumbnails(file.descriptor.hash);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value().size(), 1u);
    EXPECT_EQ(renderer_->renderCount(), 1);

    auto key = service_->readThumbnail(thumbs.value()[0].fileHash, "image/png");
    ASSERT_TRUE(key.has_value());
    auto response = service_->fetch(key.value());
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(toString(response.bytes), "png:256x256:7");
}

TEST_F(MediaServiceTest, TagsAndNamespaces) {
    auto file = addFile("image/png", "tagged");

    auto created = service_->createTags({"character:alice", "sky", "character:bob"});
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value().size(), 3u);

    auto namespaces = service_->getAllNamespaces();
    ASSERT_TRUE(namespaces.has_value());
    ASSERT_EQ(namespaces.value().size(), 1u);
    EXPECT_EQ(namespaces.value()[0].name, "character");

    std::vector<int64_t> ids;
    for (const auto& tag : created.value()) {
        if (tag.ns)
            ids.push_back(tag.id);
    }
    auto changed = service_->changeFileTags(file.id, ids, {});
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(changed.value().size(), 2u);

    auto forFile = service_->getTagsForFile(file.descriptor.hash);
    ASSERT_TRUE(forFile.has_value());
    EXPECT_EQ(forFile.value().size(), 2u);

    auto forFiles = service_->getTagsForFiles({file.descriptor.hash});
    ASSERT_TRUE(forFiles.has_value());
    EXPECT_EQ(forFiles.value().size(), 2u);

    auto found = service_->findFiles({{"character:alice", false}}, {});
    ASSERT_TRUE(found.has_value());
    ASSERT_EQ(found.value().size(), 1u);
    EXPECT_EQ(found.value()[0].cd, file.descriptor.hash);
}

TEST_F(MediaServiceTest, FileMetadata) {
    auto file = addFile("text/plain", "notes");

    auto renamed = service_->updateFileName(file.id, "notes.txt");
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed.value().name, std::optional<std::string>("notes.txt"));

    auto metadata = service_->getFileMetadata(file.id);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata.value().name, std::optional<std::string>("notes.txt"));

    auto missing = service_->getFileMetadata(424242);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, ErrorCode::NotFound);

    auto all = service_->getAllFiles();
    ASSERT_TRUE(all.has_value());
    EXPECT_EQ(all.value().size(), 1u);
}

TEST_F(MediaServiceTest, DisconnectedCallsFail) {
    addFile("text/plain", "hello");
    ASSERT_TRUE(service_->disconnect().has_value());
    EXPECT_FALSE(service_->isConnected());

    auto files = service_->getAllFiles();
    ASSERT_FALSE(files.has_value());
    EXPECT_EQ(files.error().code, ErrorCode::UpstreamDisconnected);

    auto response = service_->fetchContent(HELLO_HASH);
    EXPECT_EQ(response.status, 500);
}

class MediaServiceSweepTest : public ::testing::Test {
protected:
    void SetUp() override { renderer_ = std::make_shared<tests::FakeRenderer>(); }

    void TearDown() override { spdlog::set_level(spdlog::level::info); }

    void addContent(MediaService& service, const std::string& content) {
        auto now = std::chrono::system_clock::now();
        auto file = service.connectionState()->with(
            [&](Repository& repo) { return repo.addFile("text/plain", toBytes(content), now, now); });
        ASSERT_TRUE(file.has_value());
    }

    tests::TempDir dir_;
    boost::asio::io_context io_;
    std::shared_ptr<tests::FakeRenderer> renderer_;
};

TEST_F(MediaServiceSweepTest, StagedBuffersExpireOnConfiguredSchedule) {
    using namespace std::chrono_literals;
    MediaService service(renderer_, io_.get_executor());

    auto config = tests::make_repository_config(dir_.path());
    config.buffer.ttl = 20ms;
    config.buffer.oneShotMaxAge = 20ms;
    config.buffer.sweepInterval = 10ms;
    ASSERT_TRUE(service.connect(config).has_value());
    EXPECT_TRUE(service.isSweeping());

    addContent(service, "hello");
    EXPECT_EQ(service.fetchContent(HELLO_HASH).status, 200);
    auto once = service.readFileByHash(HELLO_HASH, "text/plain");
    ASSERT_TRUE(once.has_value());
    EXPECT_EQ(service.buffers()->size(), 2u);

    io_.run_for(300ms);
    EXPECT_FALSE(service.buffers()->contains(HELLO_HASH));
    EXPECT_FALSE(service.buffers()->contains(once.value()));
    EXPECT_EQ(service.fetch(once.value()).status, 404);
}

TEST_F(MediaServiceSweepTest, NoSweeperWithoutExecutor) {
    MediaService service(renderer_);
    ASSERT_TRUE(service.connect(tests::make_repository_config(dir_.path())).has_value());
    EXPECT_FALSE(service.isSweeping());
}

TEST_F(MediaServiceSweepTest, ConnectAppliesLogLevel) {
    MediaService service(renderer_, io_.get_executor());

    auto config = tests::make_repository_config(dir_.path());
    config.logLevel = "warn";
    ASSERT_TRUE(service.connect(config).has_value());
    EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
}

TEST_F(MediaServiceSweepTest, UnknownLogLevelFailsConnect) {
    MediaService service(renderer_, io_.get_executor());

    auto config = tests::make_repository_config(dir_.path());
    config.logLevel = "chatty";
    auto connected = service.connect(config);
    ASSERT_FALSE(connected.has_value());
    EXPECT_EQ(connected.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(service.isConnected());
    EXPECT_FALSE(service.isSweeping());
}
