#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>
#include <mediarepo/core/types.h>
#include <mediarepo/metadata/models.h>

namespace mediarepo::api {

struct FileBasicDataResponse {
    int64_t id = 0;
    metadata::FileStatus status = metadata::FileStatus::Imported;
    std::string cd; ///< Content hash
    std::optional<std::string> mimeType;
};

struct FileMetadataResponse {
    int64_t fileId = 0;
    std::optional<std::string> name;
    std::optional<std::string> comment;
    TimePoint creationTime;
    TimePoint changeTime;
    TimePoint importTime;
};

struct TagResponse {
    int64_t id = 0;
    std::optional<std::string> ns;
    std::string name;
};

struct NamespaceResponse {
    int64_t id = 0;
    std::string name;
};

struct ThumbnailMetadataResponse {
    std::string fileHash; ///< Hash of the thumbnail's own content
    uint32_t height = 0;
    uint32_t width = 0;
    std::string mimeType;
};

/**
 * @brief Result of a content fetch: 200 with the payload, 404 for unknown keys, 500 otherwise
 */
struct ContentResponse {
    int status = 200;
    std::string mimeType;
    ByteVector bytes;

    static ContentResponse notFound(std::string_view what);
    static ContentResponse failure(const Error& error);
};

FileBasicDataResponse toBasicDataResponse(const metadata::FileInfo& file);
FileMetadataResponse toMetadataResponse(const metadata::FileInfo& file);
TagResponse toResponse(const metadata::TagInfo& tag);
NamespaceResponse toResponse(const metadata::NamespaceInfo& ns);
ThumbnailMetadataResponse toResponse(const metadata::ThumbnailInfo& thumbnail);

template <typename Model, typename Mapper>
auto mapAll(const std::vector<Model>& models, Mapper&& mapper) {
    std::vector<std::invoke_result_t<Mapper, const Model&>> out;
    out.reserve(models.size());
    for (const auto& model : models) {
        out.push_back(mapper(model));
    }
    return out;
}

} // namespace mediarepo::api
