#pragma once

#include <memory>
#include <optional>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/connection_pool.h>
#include <mediarepo/metadata/file_repository.h>
#include <mediarepo/metadata/models.h>
#include <mediarepo/storage/content_store.h>
#include <mediarepo/thumbnail/thumbnail_renderer.h>

namespace mediarepo::thumbnail {

/**
 * @brief Acceptable stored dimensions for a requested size, inclusive at both ends
 */
struct ToleranceWindow {
    uint32_t minHeight = 0;
    uint32_t maxHeight = 0;
    uint32_t minWidth = 0;
    uint32_t maxWidth = 0;

    bool contains(uint32_t height, uint32_t width) const {
        return height >= minHeight && height <= maxHeight && width >= minWidth &&
               width <= maxWidth;
    }
};

// [trunc(h * 0.8), trunc(h * 1.2)] x [trunc(w * 0.8), trunc(w * 1.2)]
ToleranceWindow toleranceWindow(uint32_t height, uint32_t width);

struct ThumbnailWithBytes {
    metadata::ThumbnailInfo info;
    ByteVector bytes;
};

/**
 * @brief Stores, finds and renders thumbnails
 *
 * A request reuses any stored thumbnail of the file whose dimensions fall inside the
 * tolerance window, then one already rendered at the tier the request maps to; only a miss
 * renders.
 */
class ThumbnailManager {
public:
    ThumbnailManager(std::shared_ptr<metadata::ConnectionPool> pool,
                     std::shared_ptr<metadata::FileRepository> files,
                     std::shared_ptr<storage::ContentStore> content,
                     std::shared_ptr<IThumbnailRenderer> renderer);

    Result<ThumbnailWithBytes> getOrCreate(const metadata::FileInfo& file,
                                           const std::optional<metadata::StorageLocation>& location,
                                           uint32_t height, uint32_t width);

    /**
     * @brief Render and store a thumbnail at a tier unconditionally
     */
    Result<ThumbnailWithBytes>
    createForSizeTier(const metadata::FileInfo& file,
                      const std::optional<metadata::StorageLocation>& location,
                      ThumbnailSize size);

    /**
     * @brief Precompute thumbnails for several tiers (Medium when sizes is empty)
     */
    Result<std::vector<metadata::ThumbnailInfo>>
    createThumbnails(const metadata::FileInfo& file,
                     const std::optional<metadata::StorageLocation>& location,
                     const std::vector<ThumbnailSize>& sizes);

    Result<std::vector<metadata::ThumbnailInfo>> thumbnailsForFile(int64_t fileId);
    Result<std::optional<metadata::ThumbnailInfo>> thumbnailByHash(const Hash& hash);
    Result<ByteVector> readThumbnail(const metadata::ThumbnailInfo& thumbnail);

private:
    std::shared_ptr<metadata::ConnectionPool> pool_;
    std::shared_ptr<metadata::FileRepository> files_;
    std::shared_ptr<storage::ContentStore> content_;
    std::shared_ptr<IThumbnailRenderer> renderer_;

    Result<metadata::ThumbnailInfo> insertThumbnail(const metadata::FileInfo& file,
                                                    const metadata::ContentDescriptor& descriptor,
                                                    const metadata::StorageLocation& location,
                                                    const RenderedThumbnail& rendered,
                                                    ThumbnailSize size);
};

} // namespace mediarepo::thumbnail
