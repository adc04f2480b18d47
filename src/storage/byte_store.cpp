#include <spdlog/spdlog.h>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <vector>
#include <mediarepo/storage/byte_store.h>

namespace mediarepo::storage {

namespace {
constexpr size_t TEMP_NAME_LENGTH = 16;
constexpr size_t SHARD_DEPTH = 2;
constexpr std::string_view TEMP_DIR = ".tmp";
} // namespace

std::string hashToRelativePath(std::string_view hash) {
    if (hash.size() <= SHARD_DEPTH) {
        return std::string(hash);
    }
    return std::string(hash.substr(0, SHARD_DEPTH)) + "/" + std::string(hash.substr(SHARD_DEPTH));
}

struct FilesystemByteStore::Impl {
    std::filesystem::path root;

    // Mutex pool for per-path write synchronization
    struct MutexPool {
        std::vector<std::unique_ptr<std::mutex>> mutexes;

        explicit MutexPool(size_t size) {
            mutexes.reserve(size);
            for (size_t i = 0; i < size; ++i) {
                mutexes.emplace_back(std::make_unique<std::mutex>());
            }
        }

        std::mutex& getMutex(std::string_view key) {
            auto index = std::hash<std::string_view>{}(key) % mutexes.size();
            return *mutexes[index];
        }
    } writeMutexPool;

    Impl(std::filesystem::path r, size_t poolSize)
        : root(std::move(r)), writeMutexPool(poolSize == 0 ? 1 : poolSize) {}
};

FilesystemByteStore::FilesystemByteStore(std::filesystem::path root, size_t mutexPoolSize)
    : pImpl(std::make_unique<Impl>(std::move(root), mutexPoolSize)) {
    spdlog::debug("Initialized byte store at: {}", pImpl->root.string());
}

FilesystemByteStore::~FilesystemByteStore() = default;

std::filesystem::path FilesystemByteStore::root() const {
    return pImpl->root;
}

std::filesystem::path FilesystemByteStore::getTempPath() const {
    static thread_local std::random_device rd;
    static thread_local std::mt19937 gen(rd());
    static thread_local std::uniform_int_distribution<> dis(0, 15);

    std::string tempName;
    tempName.reserve(TEMP_NAME_LENGTH);
    for (size_t i = 0; i < TEMP_NAME_LENGTH; ++i) {
        tempName += fmt::format("{:x}", dis(gen));
    }

    return pImpl->root / TEMP_DIR / tempName;
}

Result<void> FilesystemByteStore::write(std::string_view relativePath,
                                        std::span<const std::byte> data) {
    if (relativePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "Empty storage path"};
    }

    auto target = pImpl->root / std::filesystem::path(std::string(relativePath));

    std::lock_guard<std::mutex> lock(pImpl->writeMutexPool.getMutex(relativePath));

    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        spdlog::debug("Object {} already present in {}", relativePath, pImpl->root.string());
        return {};
    }

    auto result = atomicWrite(target, data);
    if (result) {
        spdlog::debug("Stored {} ({} bytes) in {}", relativePath, data.size(),
                      pImpl->root.string());
    }
    return result;
}

Result<void> FilesystemByteStore::atomicWrite(const std::filesystem::path& path,
                                              std::span<const std::byte> data) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
        spdlog::error("Failed to create directory {}: {}", path.parent_path().string(),
                      ec.message());
        return Error{ErrorCode::IOError, "Failed to create directory: " + ec.message()};
    }

    auto tempPath = getTempPath();
    std::filesystem::create_directories(tempPath.parent_path(), ec);
    if (ec) {
        spdlog::error("Failed to create temp directory {}: {}", tempPath.parent_path().string(),
                      ec.message());
        return Error{ErrorCode::IOError, "Failed to create temp directory: " + ec.message()};
    }

    {
        std::ofstream file(tempPath, std::ios::binary);
        if (!file) {
            spdlog::error("Failed to create temp file: {}", tempPath.string());
            return Error{ErrorCode::IOError, "Failed to create temp file " + tempPath.string()};
        }

        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            file.close();
            std::filesystem::remove(tempPath, ec);
            return Error{ErrorCode::IOError, "Failed to write temp file " + tempPath.string()};
        }
    }

    std::filesystem::rename(tempPath, path, ec);
    if (ec) {
        std::error_code removeEc;
        std::filesystem::remove(tempPath, removeEc);

        // Another writer got there first (not an error for content-addressed storage)
        if (std::filesystem::exists(path, removeEc)) {
            return {};
        }

        spdlog::error("Failed to rename {} to {}: {}", tempPath.string(), path.string(),
                      ec.message());
        return Error{ErrorCode::IOError, "Failed to rename into place: " + ec.message()};
    }

    return {};
}

Result<ByteVector> FilesystemByteStore::read(std::string_view relativePath) const {
    auto path = pImpl->root / std::filesystem::path(std::string(relativePath));

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "No such object: " + path.string()};
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return Error{ErrorCode::IOError, "Failed to open " + path.string()};
    }

    auto fileSize = file.tellg();
    file.seekg(0, std::ios::beg);

    ByteVector data(static_cast<size_t>(fileSize));
    file.read(reinterpret_cast<char*>(data.data()), fileSize);
    if (!file) {
        return Error{ErrorCode::IOError, "Failed to read " + path.string()};
    }

    return data;
}

bool FilesystemByteStore::exists(std::string_view relativePath) const {
    std::error_code ec;
    return std::filesystem::exists(pImpl->root / std::filesystem::path(std::string(relativePath)),
                                   ec);
}

} // namespace mediarepo::storage
