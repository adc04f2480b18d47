#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <mediarepo/thumbnail/thumbnail_renderer.h>

namespace mediarepo::tests {

/**
 * @brief Renderer that records calls and returns deterministic "PNG" bytes
 *
 * The output dimensions are the tier's unless overridden with setDimensions().
 */
class FakeRenderer : public thumbnail::IThumbnailRenderer {
public:
    Result<thumbnail::RenderedThumbnail> render(ByteSpan source,
                                                const std::optional<std::string>& mimeHint,
                                                thumbnail::ThumbnailSize size) override {
        renders_.fetch_add(1);
        std::lock_guard<std::mutex> lock(mutex_);
        lastMime_ = mimeHint;
        if (fail_) {
            return Error{ErrorCode::InvalidArgument, "unsupported image"};
        }

        auto dims = dimensions_.value_or(thumbnail::tierDimensions(size));
        thumbnail::RenderedThumbnail out;
        out.bytes = toBytes(fmt::format("png:{}x{}:{}", dims.height, dims.width, source.size()));
        out.height = dims.height;
        out.width = dims.width;
        return out;
    }

    int renderCount() const { return renders_.load(); }

    void setDimensions(uint32_t height, uint32_t width) {
        std::lock_guard<std::mutex> lock(mutex_);
        dimensions_ = thumbnail::Dimensions{height, width};
    }

    void setFailing(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

    std::optional<std::string> lastMime() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastMime_;
    }

private:
    std::atomic<int> renders_{0};
    mutable std::mutex mutex_;
    std::optional<thumbnail::Dimensions> dimensions_;
    std::optional<std::string> lastMime_;
    bool fail_ = false;
};

} // namespace mediarepo::tests
