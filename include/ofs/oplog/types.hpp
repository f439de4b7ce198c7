#pragma once

#include "ofs/core/clock.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace ofs::oplog {

/**
 * @brief Mutation intents that can be recorded while offline
 */
enum class OperationType {
    CreateDraft,
    UpdateDraft,
    DeleteDraft,
    UploadImage,
    DeleteImage,
    UpdateSettings
};

enum class OperationStatus {
    Pending,
    Synced,   ///< Terminal
    Failed    ///< Needs requeue() before the orchestrator touches it again
};

const char* to_string(OperationType type) noexcept;
const char* to_string(OperationStatus status) noexcept;
std::optional<OperationType> parse_operation_type(const std::string& text);
std::optional<OperationStatus> parse_operation_status(const std::string& text);

/**
 * @brief True for operations whose successful replay removes the entity
 */
inline bool is_deletion(OperationType type) noexcept {
    return type == OperationType::DeleteDraft || type == OperationType::DeleteImage;
}

/**
 * @brief One durable mutation intent
 *
 * `data` is an opaque byte payload; the producer serializes it and the
 * remote API adapter interprets it. The log never looks inside.
 */
struct OperationRecord {
    std::string id;
    OperationType operation = OperationType::CreateDraft;
    std::string entity_type;
    std::string entity_id;
    std::string data;
    OperationStatus status = OperationStatus::Pending;
    TimePoint timestamp{};
    std::uint32_t retry_count = 0;
    std::optional<std::string> error;
    std::int64_t sequence = 0;   ///< Insertion order tie-breaker
};

} // namespace ofs::oplog
