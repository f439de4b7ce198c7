#include "ofs/upload/types.hpp"

namespace ofs::upload {

const char* to_string(UploadStatus status) noexcept {
    switch (status) {
        case UploadStatus::Pending: return "pending";
        case UploadStatus::Uploading: return "uploading";
        case UploadStatus::Paused: return "paused";
        case UploadStatus::Completed: return "completed";
        case UploadStatus::Failed: return "failed";
        case UploadStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

const char* to_string(FileCategory category) noexcept {
    switch (category) {
        case FileCategory::Image: return "image";
        case FileCategory::Video: return "video";
        case FileCategory::Audio: return "audio";
        case FileCategory::Document: return "document";
        case FileCategory::Archive: return "archive";
        case FileCategory::Code: return "code";
        case FileCategory::Other: return "other";
    }
    return "other";
}

} // namespace ofs::upload
