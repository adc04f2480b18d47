#include <spdlog/spdlog.h>
#include <mediarepo/crypto/hasher.h>
#include <mediarepo/metadata/find_or_create.h>
#include <mediarepo/storage/content_store.h>

namespace mediarepo::storage {

using metadata::ContentDescriptor;
using metadata::Database;
using metadata::StorageLocation;

ContentStore::ContentStore(std::shared_ptr<metadata::ConnectionPool> pool)
    : pool_(std::move(pool)) {}

ContentStore::~ContentStore() = default;

std::shared_ptr<IByteStore> ContentStore::byteStoreFor(const StorageLocation& location) {
    std::lock_guard<std::mutex> lock(storesMutex_);
    auto it = stores_.find(location.path);
    if (it != stores_.end()) {
        return it->second;
    }
    auto store = std::make_shared<FilesystemByteStore>(location.path);
    stores_.emplace(location.path, store);
    return store;
}

std::filesystem::path ContentStore::pathFor(const StorageLocation& location,
                                            const Hash& hash) const {
    return std::filesystem::path(location.path) / hashToRelativePath(hash);
}

Result<ContentDescriptor> ContentStore::store(const StorageLocation& location,
                                              std::span<const std::byte> data) {
    auto hash = crypto::SHA256Hasher::hash(data);

    auto byteStore = byteStoreFor(location);
    auto relative = hashToRelativePath(hash);
    if (!byteStore->exists(relative)) {
        auto writeResult = byteStore->write(relative, data);
        if (!writeResult) {
            spdlog::error("Failed to store {} in '{}': {}", hash, location.name,
                          writeResult.error().message);
            return writeResult.error();
        }
    }

    return pool_->withConnection([&](Database& db) -> Result<ContentDescriptor> {
        return metadata::findOrCreate<ContentDescriptor>(db, hash);
    });
}

Result<ContentDescriptor> ContentStore::store(const StorageLocation& location, std::istream& in) {
    ByteVector data;
    std::vector<char> buffer(DEFAULT_BUFFER_SIZE);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto bytesRead = in.gcount();
        for (std::streamsize i = 0; i < bytesRead; ++i) {
            data.push_back(static_cast<std::byte>(buffer[static_cast<size_t>(i)]));
        }
    }
    if (in.bad()) {
        return Error{ErrorCode::IOError, "Failed to read input stream"};
    }
    return store(location, std::span<const std::byte>(data));
}

Result<ByteVector> ContentStore::read(const StorageLocation& location,
                                      const ContentDescriptor& descriptor) {
    auto byteStore = byteStoreFor(location);
    auto result = byteStore->read(hashToRelativePath(descriptor.hash));
    if (!result) {
        if (result.error().code == ErrorCode::NotFound) {
            spdlog::error("Content {} (descriptor {}) is missing from storage '{}' at {}",
                          descriptor.hash, descriptor.id, location.name,
                          pathFor(location, descriptor.hash).string());
            return Error{ErrorCode::IntegrityError,
                         fmt::format("Bytes for {} missing from storage '{}'", descriptor.hash,
                                     location.name)};
        }
        return result.error();
    }
    return result;
}

Result<bool> ContentStore::exists(const StorageLocation& location,
                                  const ContentDescriptor& descriptor) {
    return byteStoreFor(location)->exists(hashToRelativePath(descriptor.hash));
}

Result<std::optional<ContentDescriptor>> ContentStore::descriptorByHash(const Hash& hash) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<ContentDescriptor>> {
        return metadata::findByKey<ContentDescriptor>(db, hash);
    });
}

Result<std::optional<ContentDescriptor>> ContentStore::descriptorById(int64_t id) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<ContentDescriptor>> {
        auto stmtResult = db.prepare("SELECT id, hash FROM content_descriptors WHERE id = ?");
        if (!stmtResult)
            return stmtResult.error();

        auto stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, id);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<ContentDescriptor>{};

        return std::optional<ContentDescriptor>{
            metadata::UniqueKeyTraits<ContentDescriptor>::extract(stmt)};
    });
}

} // namespace mediarepo::storage
