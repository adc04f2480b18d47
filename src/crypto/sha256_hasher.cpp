#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <array>
#include <fstream>
#include <stdexcept>
#include <mediarepo/crypto/hasher.h>

namespace mediarepo::crypto {

struct SHA256Hasher::Context {
    struct Free {
        void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
    };
    std::unique_ptr<EVP_MD_CTX, Free> md{EVP_MD_CTX_new()};
};

SHA256Hasher::SHA256Hasher() : ctx_(std::make_unique<Context>()) {
    if (!ctx_->md) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    restart();
}

SHA256Hasher::~SHA256Hasher() = default;
SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::restart() {
    if (EVP_DigestInit_ex(ctx_->md.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed for SHA-256");
    }
}

void SHA256Hasher::update(ByteSpan data) {
    if (data.empty()) {
        return;
    }
    if (EVP_DigestUpdate(ctx_->md.get(), data.data(), data.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_->md.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    restart();

    static constexpr char HEX[] = "0123456789abcdef";
    std::string hex(length * 2, '0');
    for (unsigned int i = 0; i < length; ++i) {
        hex[2 * i] = HEX[digest[i] >> 4];
        hex[2 * i + 1] = HEX[digest[i] & 0x0f];
    }
    return hex;
}

std::string SHA256Hasher::hash(ByteSpan data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

Result<std::string> SHA256Hasher::hashStream(std::istream& in) {
    SHA256Hasher hasher;
    ByteVector chunk(DEFAULT_BUFFER_SIZE);
    while (in.read(reinterpret_cast<char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk.size())) ||
           in.gcount() > 0) {
        hasher.update(ByteSpan(chunk.data(), static_cast<size_t>(in.gcount())));
        if (in.eof())
            break;
    }
    if (in.bad()) {
        return Error{ErrorCode::IOError, "Read error while hashing stream"};
    }
    return hasher.finalize();
}

Result<std::string> SHA256Hasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        spdlog::debug("Cannot open {} for hashing", path.string());
        return Error{ErrorCode::NotFound, "Cannot open file: " + path.string()};
    }
    return hashStream(file);
}

} // namespace mediarepo::crypto
