#pragma once

#include <istream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/models.h>
#include <mediarepo/storage/byte_store.h>

namespace mediarepo::storage {

/**
 * @brief Content-addressed storage with deduplication
 *
 * Bytes live in a storage location under their SHA-256; the descriptor row is shared by
 * every file with identical content. Storing the same bytes again yields the same
 * descriptor and writes nothing.
 */
class ContentStore {
public:
    explicit ContentStore(std::shared_ptr<metadata::ConnectionPool> pool);
    ~ContentStore();

    ContentStore(const ContentStore&) = delete;
    ContentStore& operator=(const ContentStore&) = delete;

    Result<metadata::ContentDescriptor> store(const metadata::StorageLocation& location,
                                              std::span<const std::byte> data);
    Result<metadata::ContentDescriptor> store(const metadata::StorageLocation& location,
                                              std::istream& in);

    /**
     * @brief Read a descriptor's bytes from a location
     *
     * Fails with IntegrityError when the row exists but the bytes are gone.
     */
    Result<ByteVector> read(const metadata::StorageLocation& location,
                            const metadata::ContentDescriptor& descriptor);

    Result<bool> exists(const metadata::StorageLocation& location,
                        const metadata::ContentDescriptor& descriptor);

    Result<std::optional<metadata::ContentDescriptor>> descriptorByHash(const Hash& hash);
    Result<std::optional<metadata::ContentDescriptor>> descriptorById(int64_t id);

    std::filesystem::path pathFor(const metadata::StorageLocation& location,
                                  const Hash& hash) const;

private:
    std::shared_ptr<metadata::ConnectionPool> pool_;
    std::mutex storesMutex_;
    std::map<std::string, std::shared_ptr<IByteStore>> stores_;

    std::shared_ptr<IByteStore> byteStoreFor(const metadata::StorageLocation& location);
};

} // namespace mediarepo::storage
