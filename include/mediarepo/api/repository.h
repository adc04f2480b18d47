#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <mediarepo/config/repository_config.h>
#include <mediarepo/core/types.h>
#include <mediarepo/detection/mime_detector.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/file_repository.h>
#include <mediarepo/metadata/models.h>
#include <mediarepo/metadata/tag_catalog.h>
#include <mediarepo/search/query_engine.h>
#include <mediarepo/storage/content_store.h>
#include <mediarepo/thumbnail/thumbnail_manager.h>

namespace mediarepo::api {

/**
 * @brief Facade over the stores of one repository
 *
 * Owns the connection pool and the designated main and thumbnail storage locations. Anything
 * that writes content needs the matching location and fails with StorageUnavailable before
 * doing any work when it is not set.
 */
class Repository {
public:
    Repository(std::shared_ptr<metadata::ConnectionPool> pool,
               std::shared_ptr<thumbnail::IThumbnailRenderer> renderer);
    ~Repository();

    Repository(const Repository&) = delete;
    Repository& operator=(const Repository&) = delete;

    /**
     * @brief Open the database, migrate it, register configured storages, select main and
     * thumbnail locations
     */
    static Result<std::unique_ptr<Repository>>
    open(const config::RepositoryConfig& config,
         std::shared_ptr<thumbnail::IThumbnailRenderer> renderer);

    // Storage locations
    Result<metadata::StorageLocation> addStorage(const std::string& name,
                                                 const std::filesystem::path& path);
    Result<std::vector<metadata::StorageLocation>> storages();
    Result<std::optional<metadata::StorageLocation>> storageByName(const std::string& name);
    Result<std::optional<metadata::StorageLocation>>
    storageByPath(const std::filesystem::path& path);
    Result<void> setMainStorage(const std::string& name);
    Result<void> setThumbnailStorage(const std::string& name);
    std::optional<metadata::StorageLocation> mainStorage() const;
    std::optional<metadata::StorageLocation> thumbnailStorage() const;

    // Files
    Result<metadata::FileInfo> addFile(const std::optional<std::string>& mimeType,
                                       ByteSpan content, TimePoint creationTime,
                                       TimePoint changeTime);

    /**
     * @brief Import a local file; MIME from content and extension, times from the filesystem
     */
    Result<metadata::FileInfo> addFileByPath(const std::filesystem::path& path);

    Result<std::optional<metadata::FileInfo>> fileById(int64_t id);
    Result<std::optional<metadata::FileInfo>> fileByHash(const Hash& hash);
    Result<std::vector<metadata::FileInfo>> files();
    Result<ByteVector> readFile(const metadata::FileInfo& file);
    Result<metadata::FileInfo> updateFileName(int64_t id, const std::optional<std::string>& name);
    Result<metadata::FileInfo> updateFileComment(int64_t id,
                                                 const std::optional<std::string>& comment);
    Result<metadata::FileInfo> setFileStatus(int64_t id, metadata::FileStatus status);

    Result<std::vector<metadata::FileInfo>>
    findFilesByTags(const std::vector<search::TagQuery>& predicates,
                    const std::vector<search::SortKey>& sortKeys = {});

    // Thumbnails
    Result<std::vector<metadata::ThumbnailInfo>> thumbnails(const metadata::FileInfo& file);
    Result<thumbnail::ThumbnailWithBytes> thumbnailOfSize(const metadata::FileInfo& file,
                                                          uint32_t height, uint32_t width);
    Result<metadata::ThumbnailInfo> createThumbnail(const metadata::FileInfo& file,
                                                    thumbnail::ThumbnailSize size);
    Result<std::vector<metadata::ThumbnailInfo>> createThumbnails(const metadata::FileInfo& file);
    Result<std::optional<metadata::ThumbnailInfo>> thumbnailByHash(const Hash& hash);
    Result<ByteVector> readThumbnail(const metadata::ThumbnailInfo& thumbnail);

    // Tags
    Result<std::vector<metadata::TagInfo>> tags();
    Result<std::vector<metadata::NamespaceInfo>> namespaces();
    Result<std::vector<metadata::TagInfo>> tagsByNames(const std::vector<std::string>& rawTags);
    Result<std::vector<metadata::TagInfo>> tagsForFile(int64_t fileId);
    Result<std::vector<metadata::TagInfo>> tagsForFiles(const std::vector<int64_t>& fileIds);
    Result<std::vector<metadata::TagInfo>> tagsForHashes(const std::vector<Hash>& hashes);
    Result<std::vector<metadata::TagInfo>> addAllTags(const std::vector<metadata::ParsedTag>& tags);
    Result<metadata::TagInfo> addOrFindTag(std::string_view raw);
    Result<std::vector<metadata::TagInfo>> changeFileTags(int64_t fileId,
                                                          const std::vector<int64_t>& addIds,
                                                          const std::vector<int64_t>& removeIds);

    /**
     * @brief Drain the connection pool; no further calls succeed afterwards
     */
    Result<void> close(std::chrono::milliseconds timeout);

    std::shared_ptr<metadata::ConnectionPool> pool() const { return pool_; }

private:
    std::shared_ptr<metadata::ConnectionPool> pool_;
    std::shared_ptr<metadata::FileRepository> files_;
    std::shared_ptr<metadata::TagCatalog> catalog_;
    std::shared_ptr<storage::ContentStore> content_;
    std::unique_ptr<search::QueryEngine> queries_;
    std::unique_ptr<thumbnail::ThumbnailManager> thumbnails_;
    detection::MimeDetector mimeDetector_;

    mutable std::mutex storageMutex_;
    std::optional<metadata::StorageLocation> mainStorage_;
    std::optional<metadata::StorageLocation> thumbnailStorage_;

    Result<metadata::StorageLocation> requireMainStorage() const;
    Result<metadata::StorageLocation> requireStorageNamed(const std::string& name);
};

} // namespace mediarepo::api
