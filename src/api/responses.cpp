#include <mediarepo/api/responses.h>

namespace mediarepo::api {

ContentResponse ContentResponse::notFound(std::string_view what) {
    return ContentResponse{404, "text/plain", toBytes(fmt::format("Resource not found: {}", what))};
}

ContentResponse ContentResponse::failure(const Error& error) {
    return ContentResponse{500, "text/plain",
                           toBytes(fmt::format("{}: {}", error.code, error.message))};
}

FileBasicDataResponse toBasicDataResponse(const metadata::FileInfo& file) {
    return FileBasicDataResponse{file.id, file.status, file.descriptor.hash, file.mimeType};
}

FileMetadataResponse toMetadataResponse(const metadata::FileInfo& file) {
    return FileMetadataResponse{file.id,           file.name,         file.comment,
                                file.creationTime, file.changeTime, file.importTime};
}

TagResponse toResponse(const metadata::TagInfo& tag) {
    TagResponse response;
    response.id = tag.id;
    if (tag.ns) {
        response.ns = tag.ns->name;
    }
    response.name = tag.name;
    return response;
}

NamespaceResponse toResponse(const metadata::NamespaceInfo& ns) {
    return NamespaceResponse{ns.id, ns.name};
}

ThumbnailMetadataResponse toResponse(const metadata::ThumbnailInfo& thumbnail) {
    return ThumbnailMetadataResponse{thumbnail.descriptor.hash, thumbnail.height, thumbnail.width,
                                     thumbnail.mimeType};
}

} // namespace mediarepo::api
