#include <gtest/gtest.h>
#include <array>
#include <mediarepo/detection/mime_detector.h>

using namespace mediarepo;
using namespace mediarepo::detection;

namespace {

ByteVector pngHeader() {
    constexpr std::array<unsigned char, 33> bytes = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A, 0x00, 0x00, 0x00,
        0x0D, 0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00,
        0x00, 0x01, 0x08, 0x06, 0x00, 0x00, 0x00, 0x1F, 0x15, 0xC4, 0x89};
    ByteVector out;
    for (auto b : bytes) {
        out.push_back(static_cast<std::byte>(b));
    }
    return out;
}

} // namespace

TEST(MimeDetectorTest, MimeFromExtension) {
    EXPECT_EQ(MimeDetector::mimeFromExtension("photo.JPG"), std::optional<std::string>("image/jpeg"));
    EXPECT_EQ(MimeDetector::mimeFromExtension("clip.webm"), std::optional<std::string>("video/webm"));
    EXPECT_EQ(MimeDetector::mimeFromExtension("/a/b/song.flac"),
              std::optional<std::string>("audio/flac"));
    EXPECT_FALSE(MimeDetector::mimeFromExtension("archive.unknownext").has_value());
    EXPECT_FALSE(MimeDetector::mimeFromExtension("README").has_value());
}

TEST(MimeDetectorTest, UninitializedFallsBackToExtension) {
    MimeDetector detector;
    EXPECT_FALSE(detector.isInitialized());

    auto raw = detector.detectFromBuffer(toBytes("anything"));
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().code, ErrorCode::InvalidState);

    EXPECT_EQ(detector.detect(toBytes("anything"), "picture.png"), "image/png");
    EXPECT_EQ(detector.detect(toBytes("anything")), "application/octet-stream");
}

TEST(MimeDetectorTest, DetectsPngMagic) {
    MimeDetector detector;
    if (!detector.initialize()) {
        GTEST_SKIP() << "libmagic database not available";
    }
    ASSERT_TRUE(detector.isInitialized());

    auto header = pngHeader();
    auto raw = detector.detectFromBuffer(header);
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(raw.value(), "image/png");

    // Content wins over a misleading name
    EXPECT_EQ(detector.detect(header, "not-really.txt"), "image/png");
}

TEST(MimeDetectorTest, GenericContentDefersToExtension) {
    MimeDetector detector;
    if (!detector.initialize()) {
        GTEST_SKIP() << "libmagic database not available";
    }

    EXPECT_EQ(detector.detect(toBytes("some prose\nmore prose\n"), "notes.md"), "text/markdown");
    EXPECT_EQ(detector.detect(toBytes("plain words\n"), "notes.unknownext"), "text/plain");
}
