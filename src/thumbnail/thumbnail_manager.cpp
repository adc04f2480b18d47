#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <mediarepo/metadata/database.h>
#include <mediarepo/thumbnail/thumbnail_manager.h>

namespace mediarepo::thumbnail {

using metadata::ContentDescriptor;
using metadata::Database;
using metadata::FileInfo;
using metadata::Statement;
using metadata::StorageLocation;
using metadata::ThumbnailInfo;

namespace {

constexpr const char* THUMBNAIL_SELECT =
    "SELECT t.id, t.file_id, t.cd_id, c.hash, t.storage_id, t.height, t.width, t.mime_type, "
    "t.size_tier "
    "FROM thumbnails t JOIN content_descriptors c ON c.id = t.cd_id";

ThumbnailInfo extractThumbnail(const Statement& stmt) {
    ThumbnailInfo info;
    info.id = stmt.getInt64(0);
    info.fileId = stmt.getInt64(1);
    info.descriptor = ContentDescriptor{stmt.getInt64(2), stmt.getString(3)};
    info.storageId = stmt.getInt64(4);
    info.height = static_cast<uint32_t>(stmt.getInt64(5));
    info.width = static_cast<uint32_t>(stmt.getInt64(6));
    info.mimeType = stmt.getString(7);
    info.sizeTier = stmt.getOptionalString(8);
    return info;
}

// Integer form of trunc(v * num / den), saturating at the uint32_t maximum
uint32_t scaleTruncated(uint32_t value, uint64_t num, uint64_t den) {
    uint64_t scaled = static_cast<uint64_t>(value) * num / den;
    return static_cast<uint32_t>(
        std::min<uint64_t>(scaled, std::numeric_limits<uint32_t>::max()));
}

constexpr ThumbnailSize ALL_TIERS[] = {ThumbnailSize::Small, ThumbnailSize::Medium,
                                       ThumbnailSize::Large};

} // namespace

Dimensions tierDimensions(ThumbnailSize size) {
    switch (size) {
        case ThumbnailSize::Small:
            return {128, 128};
        case ThumbnailSize::Medium:
            return {256, 256};
        case ThumbnailSize::Large:
            return {512, 512};
    }
    return {512, 512};
}

std::string_view thumbnailSizeToString(ThumbnailSize size) {
    switch (size) {
        case ThumbnailSize::Small:
            return "small";
        case ThumbnailSize::Medium:
            return "medium";
        case ThumbnailSize::Large:
            return "large";
    }
    return "large";
}

ThumbnailSize tierFor(uint32_t height, uint32_t width) {
    auto window = toleranceWindow(height, width);
    for (auto size : ALL_TIERS) {
        auto dims = tierDimensions(size);
        if (window.contains(dims.height, dims.width)) {
            return size;
        }
    }
    for (auto size : ALL_TIERS) {
        auto dims = tierDimensions(size);
        if (height <= dims.height && width <= dims.width) {
            return size;
        }
    }
    return ThumbnailSize::Large;
}

ToleranceWindow toleranceWindow(uint32_t height, uint32_t width) {
    return ToleranceWindow{scaleTruncated(height, 8, 10), scaleTruncated(height, 12, 10),
                           scaleTruncated(width, 8, 10), scaleTruncated(width, 12, 10)};
}

ThumbnailManager::ThumbnailManager(std::shared_ptr<metadata::ConnectionPool> pool,
                                   std::shared_ptr<metadata::FileRepository> files,
                                   std::shared_ptr<storage::ContentStore> content,
                                   std::shared_ptr<IThumbnailRenderer> renderer)
    : pool_(std::move(pool)), files_(std::move(files)), content_(std::move(content)),
      renderer_(std::move(renderer)) {}

Result<ThumbnailWithBytes>
ThumbnailManager::getOrCreate(const FileInfo& file, const std::optional<StorageLocation>& location,
                              uint32_t height, uint32_t width) {
    if (!location) {
        return Error{ErrorCode::StorageUnavailable, "No thumbnail storage configured"};
    }

    auto existing = thumbnailsForFile(file.id);
    if (!existing)
        return existing.error();

    auto window = toleranceWindow(height, width);
    auto tier = tierFor(height, width);
    auto tierName = thumbnailSizeToString(tier);

    // A window match wins; otherwise a thumbnail already rendered at the tier stands in
    const ThumbnailInfo* match = nullptr;
    for (const auto& thumb : existing.value()) {
        if (window.contains(thumb.height, thumb.width)) {
            match = &thumb;
            break;
        }
        if (!match && thumb.sizeTier && *thumb.sizeTier == tierName) {
            match = &thumb;
        }
    }

    if (match) {
        spdlog::debug("Reusing {}x{} thumbnail {} of file {} for {}x{}", match->height,
                      match->width, match->id, file.id, height, width);
        auto bytes = readThumbnail(*match);
        if (!bytes)
            return bytes.error();
        return ThumbnailWithBytes{*match, std::move(bytes).value()};
    }

    return createForSizeTier(file, location, tier);
}

Result<ThumbnailWithBytes>
ThumbnailManager::createForSizeTier(const FileInfo& file,
                                    const std::optional<StorageLocation>& location,
                                    ThumbnailSize size) {
    if (!location) {
        return Error{ErrorCode::StorageUnavailable, "No thumbnail storage configured"};
    }

    auto sourceLocation = files_->storageById(file.storageId);
    if (!sourceLocation)
        return sourceLocation.error();
    if (!sourceLocation.value()) {
        return Error{ErrorCode::NotFound,
                     fmt::format("Storage {} of file {} not found", file.storageId, file.id)};
    }

    auto source = content_->read(*sourceLocation.value(), file.descriptor);
    if (!source)
        return source.error();

    auto rendered = renderer_->render(source.value(), file.mimeType, size);
    if (!rendered) {
        spdlog::warn("Failed to render {} thumbnail for file {}: {}",
                     thumbnailSizeToString(size), file.id, rendered.error().message);
        return Error{ErrorCode::RenderFailed, rendered.error().message};
    }

    auto descriptor = content_->store(*location, std::span<const std::byte>(rendered.value().bytes));
    if (!descriptor)
        return descriptor.error();

    auto info = insertThumbnail(file, descriptor.value(), *location, rendered.value(), size);
    if (!info)
        return info.error();

    spdlog::debug("Created {}x{} thumbnail {} for file {}", info.value().height,
                  info.value().width, info.value().id, file.id);
    return ThumbnailWithBytes{std::move(info).value(), std::move(rendered).value().bytes};
}

Result<std::vector<ThumbnailInfo>>
ThumbnailManager::createThumbnails(const FileInfo& file,
                                   const std::optional<StorageLocation>& location,
                                   const std::vector<ThumbnailSize>& sizes) {
    std::vector<ThumbnailSize> tiers = sizes;
    if (tiers.empty()) {
        tiers.push_back(ThumbnailSize::Medium);
    }

    std::vector<ThumbnailInfo> created;
    for (auto size : tiers) {
        auto thumb = createForSizeTier(file, location, size);
        if (!thumb)
            return thumb.error();
        created.push_back(std::move(thumb).value().info);
    }
    return created;
}

Result<ThumbnailInfo> ThumbnailManager::insertThumbnail(const FileInfo& file,
                                                        const ContentDescriptor& descriptor,
                                                        const StorageLocation& location,
                                                        const RenderedThumbnail& rendered,
                                                        ThumbnailSize size) {
    std::string tierName(thumbnailSizeToString(size));
    return pool_->withConnection([&](Database& db) -> Result<ThumbnailInfo> {
        auto stmtResult =
            db.prepare("INSERT INTO thumbnails "
                       "(file_id, cd_id, storage_id, height, width, mime_type, size_tier) "
                       "VALUES (?, ?, ?, ?, ?, ?, ?)");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bindAll(file.id, descriptor.id, location.id,
                                       static_cast<int64_t>(rendered.height),
                                       static_cast<int64_t>(rendered.width), rendered.mimeType,
                                       tierName);
        if (!bindResult)
            return bindResult.error();

        auto execResult = stmt.execute();
        if (!execResult)
            return execResult.error();

        ThumbnailInfo info;
        info.id = db.lastInsertRowId();
        info.fileId = file.id;
        info.descriptor = descriptor;
        info.storageId = location.id;
        info.height = rendered.height;
        info.width = rendered.width;
        info.mimeType = rendered.mimeType;
        info.sizeTier = tierName;
        return info;
    });
}

Result<std::vector<ThumbnailInfo>> ThumbnailManager::thumbnailsForFile(int64_t fileId) {
    return pool_->withConnection([&](Database& db) -> Result<std::vector<ThumbnailInfo>> {
        auto stmtResult = db.prepare(std::string(THUMBNAIL_SELECT) +
                                     " WHERE t.file_id = ? ORDER BY t.height, t.width, t.id");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, fileId);
        if (!bindResult)
            return bindResult.error();

        std::vector<ThumbnailInfo> thumbs;
        while (true) {
            auto stepResult = stmt.step();
            if (!stepResult)
                return stepResult.error();
            if (!stepResult.value())
                break;
            thumbs.push_back(extractThumbnail(stmt));
        }
        return thumbs;
    });
}

Result<std::optional<ThumbnailInfo>> ThumbnailManager::thumbnailByHash(const Hash& hash) {
    return pool_->withConnection([&](Database& db) -> Result<std::optional<ThumbnailInfo>> {
        auto stmtResult =
            db.prepare(std::string(THUMBNAIL_SELECT) + " WHERE c.hash = ? ORDER BY t.id LIMIT 1");
        if (!stmtResult)
            return stmtResult.error();

        Statement stmt = std::move(stmtResult).value();
        auto bindResult = stmt.bind(1, hash);
        if (!bindResult)
            return bindResult.error();

        auto stepResult = stmt.step();
        if (!stepResult)
            return stepResult.error();
        if (!stepResult.value())
            return std::optional<ThumbnailInfo>{};
        return std::optional<ThumbnailInfo>{extractThumbnail(stmt)};
    });
}

Result<ByteVector> ThumbnailManager::readThumbnail(const ThumbnailInfo& thumbnail) {
    auto location = files_->storageById(thumbnail.storageId);
    if (!location)
        return location.error();
    if (!location.value()) {
        return Error{ErrorCode::StorageUnavailable,
                     fmt::format("Storage {} of thumbnail {} not found", thumbnail.storageId,
                                 thumbnail.id)};
    }
    return content_->read(*location.value(), thumbnail.descriptor);
}

} // namespace mediarepo::thumbnail
