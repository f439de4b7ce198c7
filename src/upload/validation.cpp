#include "ofs/upload/validation.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <vector>

namespace ofs::upload {
namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

struct CategoryTypes {
    FileCategory category;
    std::vector<std::string> mime_types;
};

const std::vector<CategoryTypes>& supported_types() {
    static const std::vector<CategoryTypes> types {
        {FileCategory::Image, {"image/jpeg", "image/jpg", "image/png", "image/gif", "image/webp",
                               "image/svg+xml", "image/bmp", "image/tiff"}},
        {FileCategory::Video, {"video/mp4", "video/avi", "video/mov", "video/wmv", "video/flv",
                               "video/webm", "video/mkv", "video/3gp"}},
        {FileCategory::Audio, {"audio/mp3", "audio/wav", "audio/ogg", "audio/aac", "audio/flac",
                               "audio/m4a", "audio/wma"}},
        {FileCategory::Document, {"application/pdf", "application/msword",
                                  "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
                                  "application/vnd.ms-excel",
                                  "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
                                  "application/vnd.ms-powerpoint",
                                  "application/vnd.openxmlformats-officedocument.presentationml.presentation",
                                  "text/plain", "text/csv", "application/rtf"}},
        {FileCategory::Archive, {"application/zip", "application/x-rar-compressed", "application/x-7z-compressed",
                                 "application/x-tar", "application/gzip"}},
        {FileCategory::Code, {"text/javascript", "text/typescript", "text/html", "text/css",
                              "application/json", "text/xml", "text/markdown"}},
    };
    return types;
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::optional<FileCategory> categorize(const std::string& mime_type) {
    const auto needle = lowercase(mime_type);
    for (const auto& entry : supported_types()) {
        if (std::find(entry.mime_types.begin(), entry.mime_types.end(), needle) != entry.mime_types.end()) {
            return entry.category;
        }
    }
    return std::nullopt;
}

std::uint64_t max_size_for(FileCategory category) noexcept {
    switch (category) {
        case FileCategory::Image: return 10 * kMiB;
        case FileCategory::Video: return 500 * kMiB;
        case FileCategory::Audio: return 100 * kMiB;
        case FileCategory::Document: return 50 * kMiB;
        case FileCategory::Archive: return 100 * kMiB;
        case FileCategory::Code:
        case FileCategory::Other: return 20 * kMiB;
    }
    return 20 * kMiB;
}

Result<FileCategory> validate_file(const std::string& file_name, std::uint64_t size, const std::string& mime_type) {
    auto category = categorize(mime_type);
    if (!category) {
        return Fail<FileCategory>(ErrorKind::Validation,
                                  "unsupported file type '" + mime_type + "' for " + file_name);
    }
    if (size == 0) {
        return Fail<FileCategory>(ErrorKind::Validation, file_name + " is empty");
    }
    const auto limit = max_size_for(*category);
    if (size > limit) {
        return Fail<FileCategory>(ErrorKind::Validation,
                                  file_name + " is " + std::to_string(size) + " bytes, limit for " +
                                  to_string(*category) + " files is " + std::to_string(limit));
    }
    return Ok(*category);
}

std::string mime_type_for(const std::filesystem::path& path) {
    static const std::unordered_map<std::string, std::string> by_extension {
        {".jpg", "image/jpeg"}, {".jpeg", "image/jpeg"}, {".png", "image/png"}, {".gif", "image/gif"},
        {".webp", "image/webp"}, {".svg", "image/svg+xml"}, {".bmp", "image/bmp"}, {".tiff", "image/tiff"},
        {".mp4", "video/mp4"}, {".avi", "video/avi"}, {".mov", "video/mov"}, {".wmv", "video/wmv"},
        {".flv", "video/flv"}, {".webm", "video/webm"}, {".mkv", "video/mkv"}, {".3gp", "video/3gp"},
        {".mp3", "audio/mp3"}, {".wav", "audio/wav"}, {".ogg", "audio/ogg"}, {".aac", "audio/aac"},
        {".flac", "audio/flac"}, {".m4a", "audio/m4a"}, {".wma", "audio/wma"},
        {".pdf", "application/pdf"}, {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".txt", "text/plain"}, {".csv", "text/csv"}, {".rtf", "application/rtf"},
        {".zip", "application/zip"}, {".rar", "application/x-rar-compressed"},
        {".7z", "application/x-7z-compressed"}, {".tar", "application/x-tar"}, {".gz", "application/gzip"},
        {".js", "text/javascript"}, {".ts", "text/typescript"}, {".html", "text/html"}, {".css", "text/css"},
        {".json", "application/json"}, {".xml", "text/xml"}, {".md", "text/markdown"},
    };

    auto it = by_extension.find(lowercase(path.extension().string()));
    return it == by_extension.end() ? std::string("application/octet-stream") : it->second;
}

} // namespace ofs::upload
