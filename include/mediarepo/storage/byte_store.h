#pragma once

#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <mediarepo/core/types.h>

namespace mediarepo::storage {

/**
 * @brief Raw byte storage addressed by paths relative to a root
 */
class IByteStore {
public:
    virtual ~IByteStore() = default;

    /**
     * @brief Write bytes at relativePath; an existing file there is left untouched
     */
    virtual Result<void> write(std::string_view relativePath, std::span<const std::byte> data) = 0;

    virtual Result<ByteVector> read(std::string_view relativePath) const = 0;

    virtual bool exists(std::string_view relativePath) const = 0;

    virtual std::filesystem::path root() const = 0;
};

/**
 * @brief Filesystem byte store with atomic writes
 *
 * Data is written to <root>/.tmp/<random> and renamed into place, so readers never observe
 * a partial file. Losing a rename race against another writer of the same path is success:
 * the path is content-derived, so the winner wrote identical bytes.
 */
class FilesystemByteStore : public IByteStore {
public:
    explicit FilesystemByteStore(std::filesystem::path root, size_t mutexPoolSize = 64);
    ~FilesystemByteStore() override;

    FilesystemByteStore(const FilesystemByteStore&) = delete;
    FilesystemByteStore& operator=(const FilesystemByteStore&) = delete;

    Result<void> write(std::string_view relativePath, std::span<const std::byte> data) override;
    Result<ByteVector> read(std::string_view relativePath) const override;
    bool exists(std::string_view relativePath) const override;
    std::filesystem::path root() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    Result<void> atomicWrite(const std::filesystem::path& path, std::span<const std::byte> data);
    std::filesystem::path getTempPath() const;
};

/**
 * @brief Sharded relative path for a content hash: "ab/cdef..."
 */
std::string hashToRelativePath(std::string_view hash);

} // namespace mediarepo::storage
