#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <mediarepo/core/types.h>

namespace mediarepo::detection {

/**
 * @brief MIME type detection from content (libmagic) and file extension
 */
class MimeDetector {
public:
    MimeDetector();
    ~MimeDetector();

    MimeDetector(const MimeDetector&) = delete;
    MimeDetector& operator=(const MimeDetector&) = delete;

    /**
     * @brief Open and load the magic database
     */
    Result<void> initialize();

    [[nodiscard]] bool isInitialized() const;

    /**
     * @brief MIME type of a buffer as reported by libmagic
     */
    Result<std::string> detectFromBuffer(ByteSpan data) const;

    /**
     * @brief Best MIME type for content with an optional file name hint
     *
     * A specific libmagic answer wins; for generic answers (octet-stream, text/plain) a known
     * extension is preferred. Falls back to application/octet-stream.
     */
    std::string detect(ByteSpan data, const std::filesystem::path& nameHint = {}) const;

    static std::optional<std::string> mimeFromExtension(const std::filesystem::path& path);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mediarepo::detection
