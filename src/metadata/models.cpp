#include <mediarepo/metadata/models.h>

namespace mediarepo::metadata {

std::string_view fileStatusToString(FileStatus status) {
    switch (status) {
        case FileStatus::Imported:
            return "imported";
        case FileStatus::Archived:
            return "archived";
        case FileStatus::Deleted:
            return "deleted";
    }
    return "imported";
}

std::string_view fileTypeToString(FileType type) {
    switch (type) {
        case FileType::Image:
            return "image";
        case FileType::Video:
            return "video";
        case FileType::Audio:
            return "audio";
        case FileType::Unknown:
            return "unknown";
    }
    return "unknown";
}

FileType fileTypeFromMime(const std::optional<std::string>& mime) {
    if (!mime) {
        return FileType::Unknown;
    }
    std::string_view m = *mime;
    if (m.starts_with("image/")) {
        return FileType::Image;
    }
    if (m.starts_with("video/")) {
        return FileType::Video;
    }
    if (m.starts_with("audio/")) {
        return FileType::Audio;
    }
    return FileType::Unknown;
}

std::string TagInfo::fullName() const {
    if (ns) {
        return ns->name + ":" + name;
    }
    return name;
}

} // namespace mediarepo::metadata
