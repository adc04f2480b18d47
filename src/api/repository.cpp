#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <system_error>
#include <mediarepo/api/repository.h>
#include <mediarepo/metadata/migration.h>

namespace mediarepo::api {

using metadata::FileInfo;
using metadata::StorageLocation;
using metadata::TagInfo;
using metadata::ThumbnailInfo;

namespace {

constexpr size_t MIME_SNIFF_BYTES = 8192;

// "type/subtype" with optional parameters; anything else is treated as absent
std::optional<std::string> normalizeMime(const std::optional<std::string>& mime) {
    if (!mime)
        return std::nullopt;

    std::string value = *mime;
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto slash = value.find('/');
    auto essenceEnd = value.find(';');
    std::string_view essence(value.data(), std::min(essenceEnd, value.size()));
    if (slash == std::string::npos || slash == 0 || slash + 1 >= essence.size() ||
        essence.find_first_of(" \t/", slash + 1) != std::string_view::npos ||
        essence.substr(0, slash).find_first_of(" \t") != std::string_view::npos) {
        spdlog::debug("Ignoring malformed MIME type '{}'", *mime);
        return std::nullopt;
    }
    return value;
}

TimePoint lastWriteTime(const std::filesystem::path& path) {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        spdlog::debug("No modification time for {}: {}", path.string(), ec.message());
        return std::chrono::system_clock::now();
    }
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

} // namespace

Repository::Repository(std::shared_ptr<metadata::ConnectionPool> pool,
                       std::shared_ptr<thumbnail::IThumbnailRenderer> renderer)
    : pool_(std::move(pool)) {
    files_ = std::make_shared<metadata::FileRepository>(pool_);
    catalog_ = std::make_shared<metadata::TagCatalog>(pool_);
    content_ = std::make_shared<storage::ContentStore>(pool_);
    queries_ = std::make_unique<search::QueryEngine>(pool_, catalog_);
    thumbnails_ = std::make_unique<thumbnail::ThumbnailManager>(pool_, files_, content_,
                                                                std::move(renderer));

    if (auto result = mimeDetector_.initialize(); !result) {
        spdlog::warn("MIME detection falls back to file extensions: {}", result.error().message);
    }
}

Repository::~Repository() = default;

Result<std::unique_ptr<Repository>>
Repository::open(const config::RepositoryConfig& config,
                 std::shared_ptr<thumbnail::IThumbnailRenderer> renderer) {
    if (config.databasePath.empty()) {
        return Error{ErrorCode::InvalidArgument, "No database path configured"};
    }

    std::error_code ec;
    if (config.databasePath.has_parent_path()) {
        std::filesystem::create_directories(config.databasePath.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Cannot create database directory: " + ec.message()};
        }
    }

    metadata::ConnectionPoolConfig poolConfig;
    poolConfig.maxConnections = config.maxConnections;
    poolConfig.busyTimeout = config.busyTimeout;

    auto pool =
        std::make_shared<metadata::ConnectionPool>(config.databasePath.string(), poolConfig);
    MEDIAREPO_TRY(pool->initialize());
    MEDIAREPO_TRY(pool->withConnection(
        [](metadata::Database& db) -> Result<void> { return metadata::migrateToLatest(db); }));

    auto repo = std::make_unique<Repository>(pool, std::move(renderer));
    for (const auto& storage : config.storages) {
        MEDIAREPO_TRY(repo->addStorage(storage.name, storage.path));
    }
    if (config.mainStorage) {
        MEDIAREPO_TRY(repo->setMainStorage(*config.mainStorage));
    }
    if (config.thumbnailStorage) {
        MEDIAREPO_TRY(repo->setThumbnailStorage(*config.thumbnailStorage));
    }

    spdlog::info("Opened repository at {}", config.databasePath.string());
    return repo;
}

Result<StorageLocation> Repository::addStorage(const std::string& name,
                                               const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     fmt::format("Cannot create storage directory {}: {}", path.string(),
                                 ec.message())};
    }
    auto absolute = std::filesystem::absolute(path, ec);
    return files_->addStorageLocation(name, (ec ? path : absolute).lexically_normal().string());
}

Result<std::vector<StorageLocation>> Repository::storages() {
    return files_->storageLocations();
}

Result<std::optional<StorageLocation>> Repository::storageByName(const std::string& name) {
    return files_->storageByName(name);
}

Result<std::optional<StorageLocation>>
Repository::storageByPath(const std::filesystem::path& path) {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    return files_->storageByPath((ec ? path : absolute).lexically_normal().string());
}

Result<StorageLocation> Repository::requireStorageNamed(const std::string& name) {
    auto storage = files_->storageByName(name);
    if (!storage)
        return storage.error();
    if (!storage.value()) {
        return Error{ErrorCode::NotFound, "Storage location not found: " + name};
    }
    return *storage.value();
}

Result<void> Repository::setMainStorage(const std::string& name) {
    MEDIAREPO_TRY_UNWRAP(storage, requireStorageNamed(name));
    std::lock_guard<std::mutex> lock(storageMutex_);
    mainStorage_ = std::move(storage);
    return {};
}

Result<void> Repository::setThumbnailStorage(const std::string& name) {
    MEDIAREPO_TRY_UNWRAP(storage, requireStorageNamed(name));
    std::lock_guard<std::mutex> lock(storageMutex_);
    thumbnailStorage_ = std::move(storage);
    return {};
}

std::optional<StorageLocation> Repository::mainStorage() const {
    std::lock_guard<std::mutex> lock(storageMutex_);
    return mainStorage_;
}

std::optional<StorageLocation> Repository::thumbnailStorage() const {
    std::lock_guard<std::mutex> lock(storageMutex_);
    return thumbnailStorage_;
}

Result<StorageLocation> Repository::requireMainStorage() const {
    auto storage = mainStorage();
    if (!storage) {
        return Error{ErrorCode::StorageUnavailable, "No main storage configured"};
    }
    return *storage;
}

Result<FileInfo> Repository::addFile(const std::optional<std::string>& mimeType,
                                     ByteSpan content, TimePoint creationTime,
                                     TimePoint changeTime) {
    MEDIAREPO_TRY_UNWRAP(storage, requireMainStorage());
    MEDIAREPO_TRY_UNWRAP(descriptor, content_->store(storage, content));

    metadata::NewFile file;
    file.descriptor = std::move(descriptor);
    file.storageId = storage.id;
    file.mimeType = normalizeMime(mimeType);
    file.size = static_cast<int64_t>(content.size());
    file.creationTime = creationTime;
    file.changeTime = changeTime;
    file.importTime = std::chrono::system_clock::now();
    return files_->insertFile(file);
}

Result<FileInfo> Repository::addFileByPath(const std::filesystem::path& path) {
    MEDIAREPO_TRY_UNWRAP(storage, requireMainStorage());

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open file: " + path.string()};
    }

    ByteVector head(MIME_SNIFF_BYTES);
    in.read(reinterpret_cast<char*>(head.data()), static_cast<std::streamsize>(head.size()));
    head.resize(static_cast<size_t>(in.gcount()));
    auto mimeType = mimeDetector_.detect(head, path);

    in.clear();
    in.seekg(0, std::ios::beg);
    MEDIAREPO_TRY_UNWRAP(descriptor, content_->store(storage, in));

    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    auto modified = lastWriteTime(path);

    metadata::NewFile file;
    file.descriptor = std::move(descriptor);
    file.storageId = storage.id;
    file.mimeType = normalizeMime(mimeType);
    file.name = path.filename().string();
    file.size = ec ? 0 : static_cast<int64_t>(size);
    file.creationTime = modified;
    file.changeTime = modified;
    file.importTime = std::chrono::system_clock::now();

    auto inserted = files_->insertFile(file);
    if (inserted) {
        spdlog::info("Imported {} as {} ({})", path.string(), inserted.value().descriptor.hash,
                     mimeType);
    }
    return inserted;
}

Result<std::optional<FileInfo>> Repository::fileById(int64_t id) {
    return files_->fileById(id);
}

Result<std::optional<FileInfo>> Repository::fileByHash(const Hash& hash) {
    return files_->fileByHash(hash);
}

Result<std::vector<FileInfo>> Repository::files() {
    return files_->allFiles();
}

Result<ByteVector> Repository::readFile(const FileInfo& file) {
    MEDIAREPO_TRY_UNWRAP(storage, files_->storageById(file.storageId));
    if (!storage) {
        return Error{ErrorCode::IntegrityError,
                     fmt::format("File {} references missing storage {}", file.id,
                                 file.storageId)};
    }
    return content_->read(*storage, file.descriptor);
}

Result<FileInfo> Repository::updateFileName(int64_t id, const std::optional<std::string>& name) {
    return files_->updateName(id, name);
}

Result<FileInfo> Repository::updateFileComment(int64_t id,
                                               const std::optional<std::string>& comment) {
    return files_->updateComment(id, comment);
}

Result<FileInfo> Repository::setFileStatus(int64_t id, metadata::FileStatus status) {
    return files_->setStatus(id, status);
}

Result<std::vector<FileInfo>>
Repository::findFilesByTags(const std::vector<search::TagQuery>& predicates,
                            const std::vector<search::SortKey>& sortKeys) {
    return queries_->findFiles(predicates, sortKeys);
}

Result<std::vector<ThumbnailInfo>> Repository::thumbnails(const FileInfo& file) {
    return thumbnails_->thumbnailsForFile(file.id);
}

Result<thumbnail::ThumbnailWithBytes>
Repository::thumbnailOfSize(const FileInfo& file, uint32_t height, uint32_t width) {
    return thumbnails_->getOrCreate(file, thumbnailStorage(), height, width);
}

Result<ThumbnailInfo> Repository::createThumbnail(const FileInfo& file,
                                                  thumbnail::ThumbnailSize size) {
    MEDIAREPO_TRY_UNWRAP(created, thumbnails_->createForSizeTier(file, thumbnailStorage(), size));
    return std::move(created.info);
}

Result<std::vector<ThumbnailInfo>> Repository::createThumbnails(const FileInfo& file) {
    return thumbnails_->createThumbnails(file, thumbnailStorage(), {});
}

Result<std::optional<ThumbnailInfo>> Repository::thumbnailByHash(const Hash& hash) {
    return thumbnails_->thumbnailByHash(hash);
}

Result<ByteVector> Repository::readThumbnail(const ThumbnailInfo& thumbnail) {
    return thumbnails_->readThumbnail(thumbnail);
}

Result<std::vector<TagInfo>> Repository::tags() {
    return catalog_->allTags();
}

Result<std::vector<metadata::NamespaceInfo>> Repository::namespaces() {
    return catalog_->allNamespaces();
}

Result<std::vector<TagInfo>> Repository::tagsByNames(const std::vector<std::string>& rawTags) {
    return catalog_->tagsByNames(rawTags);
}

Result<std::vector<TagInfo>> Repository::tagsForFile(int64_t fileId) {
    return catalog_->tagsForFile(fileId);
}

Result<std::vector<TagInfo>> Repository::tagsForFiles(const std::vector<int64_t>& fileIds) {
    return catalog_->tagsForFiles(fileIds);
}

Result<std::vector<TagInfo>> Repository::tagsForHashes(const std::vector<Hash>& hashes) {
    return catalog_->tagsForHashes(hashes);
}

Result<std::vector<TagInfo>> Repository::addAllTags(const std::vector<metadata::ParsedTag>& tags) {
    return catalog_->addAll(tags);
}

Result<TagInfo> Repository::addOrFindTag(std::string_view raw) {
    return catalog_->findOrCreateTag(raw);
}

Result<std::vector<TagInfo>> Repository::changeFileTags(int64_t fileId,
                                                        const std::vector<int64_t>& addIds,
                                                        const std::vector<int64_t>& removeIds) {
    return catalog_->changeFileTags(fileId, addIds, removeIds);
}

Result<void> Repository::close(std::chrono::milliseconds timeout) {
    return pool_->drain(timeout);
}

} // namespace mediarepo::api
