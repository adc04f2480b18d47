#include <spdlog/spdlog.h>
#include <magic.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <string_view>
#include <unordered_map>
#include <mediarepo/detection/mime_detector.h>

namespace mediarepo::detection {

namespace {

constexpr std::string_view OCTET_STREAM = "application/octet-stream";

// Extension to MIME type mapping
const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    // Images
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".png", "image/png"},
    {".gif", "image/gif"},
    {".bmp", "image/bmp"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".avif", "image/avif"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".ico", "image/x-icon"},

    // Video
    {".mp4", "video/mp4"},
    {".m4v", "video/mp4"},
    {".avi", "video/x-msvideo"},
    {".mkv", "video/x-matroska"},
    {".webm", "video/webm"},
    {".mov", "video/quicktime"},

    // Audio
    {".mp3", "audio/mpeg"},
    {".wav", "audio/wav"},
    {".ogg", "audio/ogg"},
    {".flac", "audio/flac"},
    {".m4a", "audio/mp4"},

    // Documents and text
    {".txt", "text/plain"},
    {".md", "text/markdown"},
    {".html", "text/html"},
    {".htm", "text/html"},
    {".json", "application/json"},
    {".xml", "application/xml"},
    {".pdf", "application/pdf"},

    // Archives
    {".zip", "application/zip"},
    {".tar", "application/x-tar"},
    {".gz", "application/gzip"},
    {".7z", "application/x-7z-compressed"}};

bool isGeneric(std::string_view mime) {
    return mime.empty() || mime == OCTET_STREAM || mime == "text/plain";
}

} // namespace

class MimeDetector::Impl {
public:
    magic_t magicCookie = nullptr;
    mutable std::mutex magicMutex; // libmagic handles are not thread-safe

    ~Impl() {
        if (magicCookie) {
            std::lock_guard<std::mutex> lock(magicMutex);
            magic_close(magicCookie);
            magicCookie = nullptr;
        }
    }
};

MimeDetector::MimeDetector() : pImpl(std::make_unique<Impl>()) {}

MimeDetector::~MimeDetector() = default;

Result<void> MimeDetector::initialize() {
    std::lock_guard<std::mutex> lock(pImpl->magicMutex);
    if (pImpl->magicCookie) {
        return {};
    }

    pImpl->magicCookie = magic_open(MAGIC_MIME_TYPE | MAGIC_ERROR);
    if (!pImpl->magicCookie) {
        return Error{ErrorCode::InternalError, "Failed to initialize libmagic"};
    }

    if (magic_load(pImpl->magicCookie, nullptr) != 0) {
        std::string error = magic_error(pImpl->magicCookie);
        magic_close(pImpl->magicCookie);
        pImpl->magicCookie = nullptr;
        return Error{ErrorCode::InternalError, "Failed to load magic database: " + error};
    }

    spdlog::debug("libmagic initialized");
    return {};
}

bool MimeDetector::isInitialized() const {
    std::lock_guard<std::mutex> lock(pImpl->magicMutex);
    return pImpl->magicCookie != nullptr;
}

Result<std::string> MimeDetector::detectFromBuffer(ByteSpan data) const {
    std::lock_guard<std::mutex> lock(pImpl->magicMutex);

    if (!pImpl->magicCookie) {
        return Error{ErrorCode::InvalidState, "libmagic not initialized"};
    }

    const char* mimeType = magic_buffer(pImpl->magicCookie, data.data(), data.size());
    if (!mimeType) {
        return Error{ErrorCode::InternalError,
                     "libmagic detection failed: " + std::string(magic_error(pImpl->magicCookie))};
    }
    return std::string(mimeType);
}

std::string MimeDetector::detect(ByteSpan data, const std::filesystem::path& nameHint) const {
    std::optional<std::string> fromMagic;
    auto magicResult = detectFromBuffer(data);
    if (magicResult) {
        fromMagic = magicResult.value();
    } else {
        spdlog::debug("Content detection unavailable: {}", magicResult.error().message);
    }

    if (fromMagic && !isGeneric(*fromMagic)) {
        return *fromMagic;
    }

    if (!nameHint.empty()) {
        if (auto fromExtension = mimeFromExtension(nameHint)) {
            return *fromExtension;
        }
    }

    if (fromMagic && !fromMagic->empty()) {
        return *fromMagic;
    }
    return std::string(OCTET_STREAM);
}

std::optional<std::string> MimeDetector::mimeFromExtension(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = EXTENSION_MIME_MAP.find(ext);
    if (it != EXTENSION_MIME_MAP.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace mediarepo::detection
