#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <mediarepo/api/buffer_cache.h>
#include <mediarepo/api/connection_state.h>
#include <mediarepo/api/responses.h>
#include <mediarepo/config/repository_config.h>
#include <mediarepo/search/query_engine.h>
#include <mediarepo/thumbnail/thumbnail_renderer.h>

namespace mediarepo::api {

/**
 * @brief Operations offered to the presentation layer
 *
 * Payloads are not returned inline: readFileByHash/readThumbnail stage a OneShot buffer and
 * return its key, which is then resolved through fetch(). Content and thumbnail fetches
 * stage Persistent buffers that the sweeper expires.
 *
 * When constructed with an executor, connect(config) (re)starts a BufferSweeper on it with the
 * config's [buffer] timings. Without one, buffers are only swept by the caller.
 */
class MediaService {
public:
    static constexpr uint32_t DEFAULT_THUMBNAIL_EDGE = 250;

    explicit MediaService(std::shared_ptr<thumbnail::IThumbnailRenderer> renderer,
                          boost::asio::any_io_executor executor = {},
                          std::shared_ptr<ConnectionState> state = nullptr,
                          std::shared_ptr<BufferCache> buffers = nullptr);
    ~MediaService();

    MediaService(const MediaService&) = delete;
    MediaService& operator=(const MediaService&) = delete;

    // Connection
    /**
     * @brief Apply the log level, open the repository and swap it in, then restart the sweeper
     */
    Result<void> connect(const config::RepositoryConfig& config);
    void connect(std::shared_ptr<RepositoryHandle> handle);
    Result<void> disconnect();
    [[nodiscard]] bool isConnected() const;

    // Files
    Result<std::vector<FileBasicDataResponse>> getAllFiles();
    Result<std::vector<FileBasicDataResponse>> findFiles(const std::vector<search::TagQuery>& tags,
                                                         const std::vector<search::SortKey>& sortBy);
    Result<FileMetadataResponse> getFileMetadata(int64_t fileId);
    Result<FileMetadataResponse> updateFileName(int64_t fileId, const std::string& name);

    /**
     * @brief Stage the file's bytes as a OneShot buffer
     * @return The key to fetch, "once://<hash>"
     */
    Result<std::string> readFileByHash(const Hash& hash, const std::string& mimeType);

    // Thumbnails
    /**
     * @brief Thumbnails of the file with this content hash; renders the default tier when the
     * file has none yet
     */
    Result<std::vector<ThumbnailMetadataResponse>> getFileThumbnails(const Hash& hash);
    Result<std::string> readThumbnail(const Hash& thumbnailHash, const std::string& mimeType);

    // Tags
    Result<std::vector<TagResponse>> getAllTags();
    Result<std::vector<NamespaceResponse>> getAllNamespaces();
    Result<std::vector<TagResponse>> getTagsForFile(const Hash& hash);
    Result<std::vector<TagResponse>> getTagsForFiles(const std::vector<Hash>& hashes);
    Result<std::vector<TagResponse>> createTags(const std::vector<std::string>& tags);
    Result<std::vector<TagResponse>> changeFileTags(int64_t fileId,
                                                    const std::vector<int64_t>& addedTags,
                                                    const std::vector<int64_t>& removedTags);

    // Content fetch. Unknown keys give 404, failures 500; never an error result.
    ContentResponse fetch(std::string_view uri);
    ContentResponse fetchOnce(std::string_view key);
    ContentResponse fetchContent(const Hash& hash);
    ContentResponse fetchThumbnail(const Hash& hash, uint32_t height = DEFAULT_THUMBNAIL_EDGE,
                                   uint32_t width = DEFAULT_THUMBNAIL_EDGE);

    static std::string onceKey(const Hash& hash);
    static std::string thumbnailKey(const Hash& hash, uint32_t height, uint32_t width);

    std::shared_ptr<BufferCache> buffers() const { return buffers_; }
    std::shared_ptr<ConnectionState> connectionState() const { return state_; }
    [[nodiscard]] bool isSweeping() const;

private:
    std::shared_ptr<thumbnail::IThumbnailRenderer> renderer_;
    boost::asio::any_io_executor executor_;
    std::shared_ptr<ConnectionState> state_;
    std::shared_ptr<BufferCache> buffers_;

    mutable std::mutex sweeperMutex_;
    std::unique_ptr<BufferSweeper> sweeper_;

    void restartSweeper(const config::BufferConfig& buffer);
};

} // namespace mediarepo::api
