#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <mediarepo/api/media_service.h>

namespace mediarepo::api {

using metadata::FileInfo;

namespace {

constexpr std::string_view ONCE_SCHEME = "once://";
constexpr std::string_view CONTENT_SCHEME = "content://";
constexpr std::string_view THUMB_SCHEME = "thumb://";
constexpr std::string_view DEFAULT_CONTENT_MIME = "application/octet-stream";

Result<FileInfo> requireFileByHash(Repository& repo, const Hash& hash) {
    MEDIAREPO_TRY_UNWRAP(file, repo.fileByHash(hash));
    if (!file) {
        return Error{ErrorCode::NotFound, "No file with hash " + hash};
    }
    return std::move(*file);
}

ContentResponse errorResponse(const Error& error, std::string_view key) {
    if (error.code == ErrorCode::NotFound) {
        return ContentResponse::notFound(key);
    }
    spdlog::error("Fetching {} failed: {}", key, error.message);
    return ContentResponse::failure(error);
}

ContentResponse fromBuffer(BufferEntry entry) {
    return ContentResponse{200, std::move(entry.mimeType), std::move(entry.bytes)};
}

// Positive integer query parameter, or fallback when absent or malformed
uint32_t queryDimension(std::string_view query, std::string_view name, uint32_t fallback) {
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);

        auto eq = pair.find('=');
        if (eq == std::string_view::npos || pair.substr(0, eq) != name)
            continue;

        auto value = pair.substr(eq + 1);
        uint32_t parsed = 0;
        auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec == std::errc{} && ptr == value.data() + value.size() && parsed > 0) {
            return parsed;
        }
        return fallback;
    }
    return fallback;
}

template <typename Mapper>
auto mapTags(const Result<std::vector<metadata::TagInfo>>& tags, Mapper&& mapper)
    -> Result<std::vector<TagResponse>> {
    if (!tags)
        return tags.error();
    return mapAll(tags.value(), std::forward<Mapper>(mapper));
}

const auto tagMapper = [](const metadata::TagInfo& tag) { return toResponse(tag); };
const auto fileMapper = [](const FileInfo& file) { return toBasicDataResponse(file); };

} // namespace

MediaService::MediaService(std::shared_ptr<thumbnail::IThumbnailRenderer> renderer,
                           boost::asio::any_io_executor executor,
                           std::shared_ptr<ConnectionState> state,
                           std::shared_ptr<BufferCache> buffers)
    : renderer_(std::move(renderer)), executor_(std::move(executor)),
      state_(state ? std::move(state) : std::make_shared<ConnectionState>()),
      buffers_(buffers ? std::move(buffers) : std::make_shared<BufferCache>()) {}

MediaService::~MediaService() {
    std::lock_guard<std::mutex> lock(sweeperMutex_);
    if (sweeper_) {
        sweeper_->stop();
    }
}

Result<void> MediaService::connect(const config::RepositoryConfig& config) {
    MEDIAREPO_TRY(config::configureLogging(config.logLevel));
    MEDIAREPO_TRY_UNWRAP(repository, Repository::open(config, renderer_));
    connect(std::make_shared<RepositoryHandle>(std::move(repository)));
    restartSweeper(config.buffer);
    return {};
}

void MediaService::restartSweeper(const config::BufferConfig& buffer) {
    std::lock_guard<std::mutex> lock(sweeperMutex_);
    if (sweeper_) {
        sweeper_->stop();
        sweeper_.reset();
    }
    if (!executor_) {
        spdlog::debug("[MediaService] No executor, buffers are not swept periodically");
        return;
    }

    sweeper_ = std::make_unique<BufferSweeper>(
        buffers_, executor_,
        BufferSweeper::Config{buffer.sweepInterval, buffer.ttl, buffer.oneShotMaxAge});
    sweeper_->start();
}

bool MediaService::isSweeping() const {
    std::lock_guard<std::mutex> lock(sweeperMutex_);
    return sweeper_ && sweeper_->isRunning();
}

void MediaService::connect(std::shared_ptr<RepositoryHandle> handle) {
    state_->connect(std::move(handle));
}

Result<void> MediaService::disconnect() {
    return state_->disconnect();
}

bool MediaService::isConnected() const {
    return state_->isConnected();
}

Result<std::vector<FileBasicDataResponse>> MediaService::getAllFiles() {
    return state_->with([](Repository& repo) -> Result<std::vector<FileBasicDataResponse>> {
        MEDIAREPO_TRY_UNWRAP(files, repo.files());
        return mapAll(files, fileMapper);
    });
}

Result<std::vector<FileBasicDataResponse>>
MediaService::findFiles(const std::vector<search::TagQuery>& tags,
                        const std::vector<search::SortKey>& sortBy) {
    return state_->with([&](Repository& repo) -> Result<std::vector<FileBasicDataResponse>> {
        MEDIAREPO_TRY_UNWRAP(files, repo.findFilesByTags(tags, sortBy));
        return mapAll(files, fileMapper);
    });
}

Result<FileMetadataResponse> MediaService::getFileMetadata(int64_t fileId) {
    return state_->with([&](Repository& repo) -> Result<FileMetadataResponse> {
        MEDIAREPO_TRY_UNWRAP(file, repo.fileById(fileId));
        if (!file) {
            return Error{ErrorCode::NotFound, fmt::format("File {} not found", fileId)};
        }
        return toMetadataResponse(*file);
    });
}

Result<FileMetadataResponse> MediaService::updateFileName(int64_t fileId,
                                                          const std::string& name) {
    return state_->with([&](Repository& repo) -> Result<FileMetadataResponse> {
        MEDIAREPO_TRY_UNWRAP(file, repo.updateFileName(fileId, name));
        return toMetadataResponse(file);
    });
}

Result<std::string> MediaService::readFileByHash(const Hash& hash, const std::string& mimeType) {
    return state_->with([&](Repository& repo) -> Result<std::string> {
        MEDIAREPO_TRY_UNWRAP(file, requireFileByHash(repo, hash));
        MEDIAREPO_TRY_UNWRAP(bytes, repo.readFile(file));

        auto key = onceKey(hash);
        buffers_->put(key, mimeType, std::move(bytes), BufferMode::OneShot);
        return key;
    });
}

Result<std::vector<ThumbnailMetadataResponse>> MediaService::getFileThumbnails(const Hash& hash) {
    return state_->with([&](Repository& repo) -> Result<std::vector<ThumbnailMetadataResponse>> {
        MEDIAREPO_TRY_UNWRAP(file, requireFileByHash(repo, hash));
        MEDIAREPO_TRY_UNWRAP(thumbnails, repo.thumbnails(file));
        if (thumbnails.empty()) {
            MEDIAREPO_TRY_UNWRAP(created, repo.createThumbnails(file));
            thumbnails = std::move(created);
        }
        return mapAll(thumbnails,
                      [](const metadata::ThumbnailInfo& thumb) { return toResponse(thumb); });
    });
}

Result<std::string> MediaService::readThumbnail(const Hash& thumbnailHash,
                                                const std::string& mimeType) {
    return state_->with([&](Repository& repo) -> Result<std::string> {
        MEDIAREPO_TRY_UNWRAP(thumbnail, repo.thumbnailByHash(thumbnailHash));
        if (!thumbnail) {
            return Error{ErrorCode::NotFound, "No thumbnail with hash " + thumbnailHash};
        }
        MEDIAREPO_TRY_UNWRAP(bytes, repo.readThumbnail(*thumbnail));

        auto key = onceKey(thumbnailHash);
        buffers_->put(key, mimeType, std::move(bytes), BufferMode::OneShot);
        return key;
    });
}

Result<std::vector<TagResponse>> MediaService::getAllTags() {
    return state_->with([](Repository& repo) -> Result<std::vector<TagResponse>> {
        return mapTags(repo.tags(), tagMapper);
    });
}

Result<std::vector<NamespaceResponse>> MediaService::getAllNamespaces() {
    return state_->with([](Repository& repo) -> Result<std::vector<NamespaceResponse>> {
        MEDIAREPO_TRY_UNWRAP(namespaces, repo.namespaces());
        return mapAll(namespaces, [](const metadata::NamespaceInfo& ns) { return toResponse(ns); });
    });
}

Result<std::vector<TagResponse>> MediaService::getTagsForFile(const Hash& hash) {
    return state_->with([&](Repository& repo) -> Result<std::vector<TagResponse>> {
        MEDIAREPO_TRY_UNWRAP(file, requireFileByHash(repo, hash));
        return mapTags(repo.tagsForFile(file.id), tagMapper);
    });
}

Result<std::vector<TagResponse>> MediaService::getTagsForFiles(const std::vector<Hash>& hashes) {
    return state_->with([&](Repository& repo) -> Result<std::vector<TagResponse>> {
        return mapTags(repo.tagsForHashes(hashes), tagMapper);
    });
}

Result<std::vector<TagResponse>> MediaService::createTags(const std::vector<std::string>& tags) {
    std::vector<metadata::ParsedTag> parsed;
    parsed.reserve(tags.size());
    for (const auto& raw : tags) {
        parsed.push_back(metadata::parseTag(raw));
    }
    return state_->with([&](Repository& repo) -> Result<std::vector<TagResponse>> {
        return mapTags(repo.addAllTags(parsed), tagMapper);
    });
}

Result<std::vector<TagResponse>>
MediaService::changeFileTags(int64_t fileId, const std::vector<int64_t>& addedTags,
                             const std::vector<int64_t>& removedTags) {
    return state_->with([&](Repository& repo) -> Result<std::vector<TagResponse>> {
        return mapTags(repo.changeFileTags(fileId, addedTags, removedTags), tagMapper);
    });
}

ContentResponse MediaService::fetch(std::string_view uri) {
    if (uri.starts_with(ONCE_SCHEME)) {
        return fetchOnce(uri);
    }
    if (uri.starts_with(CONTENT_SCHEME)) {
        return fetchContent(Hash(uri.substr(CONTENT_SCHEME.size())));
    }
    if (uri.starts_with(THUMB_SCHEME)) {
        auto rest = uri.substr(THUMB_SCHEME.size());
        auto queryStart = rest.find('?');
        auto hash = rest.substr(0, std::min(queryStart, rest.find('/')));
        auto query =
            queryStart == std::string_view::npos ? std::string_view{} : rest.substr(queryStart + 1);
        return fetchThumbnail(Hash(hash),
                              queryDimension(query, "height", DEFAULT_THUMBNAIL_EDGE),
                              queryDimension(query, "width", DEFAULT_THUMBNAIL_EDGE));
    }
    return ContentResponse::notFound(uri);
}

ContentResponse MediaService::fetchOnce(std::string_view key) {
    if (key.starts_with(ONCE_SCHEME)) {
        key.remove_prefix(ONCE_SCHEME.size());
    }
    auto entry = buffers_->get(onceKey(Hash(key)));
    if (!entry) {
        return ContentResponse::notFound(key);
    }
    return fromBuffer(std::move(*entry));
}

ContentResponse MediaService::fetchContent(const Hash& hash) {
    if (auto entry = buffers_->get(hash)) {
        return fromBuffer(std::move(*entry));
    }

    auto result = state_->with([&](Repository& repo) -> Result<ContentResponse> {
        MEDIAREPO_TRY_UNWRAP(file, requireFileByHash(repo, hash));
        MEDIAREPO_TRY_UNWRAP(bytes, repo.readFile(file));
        std::string mime = file.mimeType.value_or(std::string(DEFAULT_CONTENT_MIME));
        return ContentResponse{200, std::move(mime), std::move(bytes)};
    });
    if (!result) {
        return errorResponse(result.error(), hash);
    }

    auto response = std::move(result).value();
    buffers_->put(hash, response.mimeType, response.bytes, BufferMode::Persistent);
    return response;
}

ContentResponse MediaService::fetchThumbnail(const Hash& hash, uint32_t height, uint32_t width) {
    auto key = thumbnailKey(hash, height, width);
    if (auto entry = buffers_->get(key)) {
        return fromBuffer(std::move(*entry));
    }

    auto result = state_->with([&](Repository& repo) -> Result<ContentResponse> {
        MEDIAREPO_TRY_UNWRAP(file, requireFileByHash(repo, hash));
        MEDIAREPO_TRY_UNWRAP(thumbnail, repo.thumbnailOfSize(file, height, width));
        return ContentResponse{200, thumbnail.info.mimeType, std::move(thumbnail.bytes)};
    });
    if (!result) {
        return errorResponse(result.error(), key);
    }

    auto response = std::move(result).value();
    buffers_->put(key, response.mimeType, response.bytes, BufferMode::Persistent);
    return response;
}

std::string MediaService::onceKey(const Hash& hash) {
    return std::string(ONCE_SCHEME) + hash;
}

std::string MediaService::thumbnailKey(const Hash& hash, uint32_t height, uint32_t width) {
    return fmt::format("{}{}?height={}&width={}", THUMB_SCHEME, hash, height, width);
}

} // namespace mediarepo::api
