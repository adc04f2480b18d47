#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <mediarepo/core/types.h>

namespace mediarepo::crypto {

/**
 * @brief Incremental SHA-256 producing the lowercase hex digest used as content identity
 */
class SHA256Hasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void update(ByteSpan data);

    // Digest of everything since the last finalize(); the hasher starts over afterwards
    std::string finalize();

    static std::string hash(ByteSpan data);
    static Result<std::string> hashStream(std::istream& in);
    static Result<std::string> hashFile(const std::filesystem::path& path);

private:
    struct Context;
    std::unique_ptr<Context> ctx_;

    void restart();
};

} // namespace mediarepo::crypto
