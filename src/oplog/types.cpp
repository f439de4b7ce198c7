#include "ofs/oplog/types.hpp"

namespace ofs::oplog {

const char* to_string(OperationType type) noexcept {
    switch (type) {
        case OperationType::CreateDraft: return "create_draft";
        case OperationType::UpdateDraft: return "update_draft";
        case OperationType::DeleteDraft: return "delete_draft";
        case OperationType::UploadImage: return "upload_image";
        case OperationType::DeleteImage: return "delete_image";
        case OperationType::UpdateSettings: return "update_settings";
    }
    return "unknown";
}

const char* to_string(OperationStatus status) noexcept {
    switch (status) {
        case OperationStatus::Pending: return "pending";
        case OperationStatus::Synced: return "synced";
        case OperationStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<OperationType> parse_operation_type(const std::string& text) {
    if (text == "create_draft") return OperationType::CreateDraft;
    if (text == "update_draft") return OperationType::UpdateDraft;
    if (text == "delete_draft") return OperationType::DeleteDraft;
    if (text == "upload_image") return OperationType::UploadImage;
    if (text == "delete_image") return OperationType::DeleteImage;
    if (text == "update_settings") return OperationType::UpdateSettings;
    return std::nullopt;
}

std::optional<OperationStatus> parse_operation_status(const std::string& text) {
    if (text == "pending") return OperationStatus::Pending;
    if (text == "synced") return OperationStatus::Synced;
    if (text == "failed") return OperationStatus::Failed;
    return std::nullopt;
}

} // namespace ofs::oplog
