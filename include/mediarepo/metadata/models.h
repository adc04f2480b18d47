#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <mediarepo/core/types.h>

namespace mediarepo::metadata {

/**
 * @brief Content-addressed identity of a blob, shared by every file with the same bytes
 */
struct ContentDescriptor {
    int64_t id = 0;
    Hash hash; ///< Lowercase hex SHA-256

    bool operator==(const ContentDescriptor&) const = default;
};

/**
 * @brief A named filesystem root holding content-addressed bytes
 */
struct StorageLocation {
    int64_t id = 0;
    std::string name;
    std::string path;

    bool operator==(const StorageLocation&) const = default;
};

enum class FileStatus : int { Imported = 0, Archived = 1, Deleted = 2 };

enum class FileType : int { Unknown = 0, Image = 1, Video = 2, Audio = 3 };

std::string_view fileStatusToString(FileStatus status);
std::string_view fileTypeToString(FileType type);

/**
 * @brief Classify a MIME type by its top-level type
 *
 * image/* -> Image, video/* -> Video, audio/* -> Audio, anything else or none -> Unknown.
 */
FileType fileTypeFromMime(const std::optional<std::string>& mime);

/**
 * @brief A stored file: one descriptor in one location plus its metadata
 */
struct FileInfo {
    int64_t id = 0;
    ContentDescriptor descriptor;
    int64_t storageId = 0;
    FileStatus status = FileStatus::Imported;
    FileType fileType = FileType::Unknown;
    std::optional<std::string> mimeType;
    std::optional<std::string> name;
    std::optional<std::string> comment;
    int64_t size = 0;
    TimePoint creationTime;
    TimePoint changeTime;
    TimePoint importTime;
};

struct NamespaceInfo {
    int64_t id = 0;
    std::string name;

    bool operator==(const NamespaceInfo&) const = default;
};

struct TagInfo {
    int64_t id = 0;
    std::optional<NamespaceInfo> ns;
    std::string name;

    /**
     * @brief "namespace:name" or "name"
     */
    std::string fullName() const;

    bool operator==(const TagInfo&) const = default;
};

struct ThumbnailInfo {
    int64_t id = 0;
    int64_t fileId = 0;
    ContentDescriptor descriptor;
    int64_t storageId = 0;
    uint32_t height = 0;
    uint32_t width = 0;
    std::string mimeType;
    std::optional<std::string> sizeTier; ///< Tier it was rendered at
};

} // namespace mediarepo::metadata
