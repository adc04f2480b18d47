#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <mediarepo/core/types.h>

namespace mediarepo::thumbnail {

/**
 * @brief Fixed render tiers
 */
enum class ThumbnailSize { Small, Medium, Large };

struct Dimensions {
    uint32_t height = 0;
    uint32_t width = 0;

    bool operator==(const Dimensions&) const = default;
};

// Small 128x128, Medium 256x256, Large 512x512
Dimensions tierDimensions(ThumbnailSize size);

std::string_view thumbnailSizeToString(ThumbnailSize size);

/**
 * @brief Tier to render for a request
 *
 * The first tier inside the request's tolerance window, else the smallest tier covering both
 * dimensions, else Large.
 */
ThumbnailSize tierFor(uint32_t height, uint32_t width);

struct RenderedThumbnail {
    ByteVector bytes;
    uint32_t height = 0; ///< Actual rendered height
    uint32_t width = 0;  ///< Actual rendered width
    std::string mimeType = "image/png";
};

/**
 * @brief Image decoding/scaling backend
 *
 * Renders source bytes into a thumbnail that fits the tier, keeping the aspect ratio; the
 * returned dimensions are the real ones.
 */
class IThumbnailRenderer {
public:
    virtual ~IThumbnailRenderer() = default;

    virtual Result<RenderedThumbnail> render(ByteSpan source,
                                             const std::optional<std::string>& mimeHint,
                                             ThumbnailSize size) = 0;
};

} // namespace mediarepo::thumbnail
