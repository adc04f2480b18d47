#include <gtest/gtest.h>
#include <sstream>
#include <mediarepo/crypto/hasher.h>
#include "../../common/test_helpers.h"

using namespace mediarepo;
using namespace mediarepo::crypto;

namespace {
constexpr const char* HELLO_SHA256 =
    "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
constexpr const char* EMPTY_SHA256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
} // namespace

TEST(SHA256HasherTest, KnownDigests) {
    EXPECT_EQ(SHA256Hasher::hash(toBytes("hello")), HELLO_SHA256);
    EXPECT_EQ(SHA256Hasher::hash(ByteSpan{}), EMPTY_SHA256);
}

TEST(SHA256HasherTest, IncrementalMatchesOneShot) {
    SHA256Hasher hasher;
    auto he = toBytes("he");
    auto llo = toBytes("llo");
    hasher.update(he);
    hasher.update(llo);
    EXPECT_EQ(hasher.finalize(), HELLO_SHA256);

    // finalize() starts a fresh digest
    EXPECT_EQ(hasher.finalize(), EMPTY_SHA256);
}

TEST(SHA256HasherTest, StreamAndFile) {
    std::istringstream in("hello");
    auto streamHash = SHA256Hasher::hashStream(in);
    ASSERT_TRUE(streamHash.has_value());
    EXPECT_EQ(streamHash.value(), HELLO_SHA256);

    tests::TempDir dir;
    auto path = tests::write_file(dir / "hello.txt", "hello");
    auto fileHash = SHA256Hasher::hashFile(path);
    ASSERT_TRUE(fileHash.has_value());
    EXPECT_EQ(fileHash.value(), HELLO_SHA256);
}

TEST(SHA256HasherTest, MissingFileIsNotFound) {
    auto result = SHA256Hasher::hashFile("/nonexistent/mediarepo/file.bin");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
}
