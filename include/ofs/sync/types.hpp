#pragma once

#include "ofs/core/clock.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace ofs::sync {

enum class ConflictPolicy {
    Manual,
    LocalWins,
    RemoteWins,
    Merge
};

const char* to_string(ConflictPolicy policy) noexcept;
std::optional<ConflictPolicy> parse_conflict_policy(const std::string& text);

/**
 * @brief Orchestrator state within one sync cycle
 *
 * Idle -> Draining -> (Replaying per record) -> Idle
 */
enum class SyncState {
    Idle,
    Draining,
    Replaying
};

const char* to_string(SyncState state) noexcept;

/**
 * @brief Outcome of one sync_pending_operations() call
 */
struct SyncSummary {
    std::size_t synced_count = 0;
    std::size_t failed_count = 0;
    std::size_t conflict_count = 0;   ///< Records that hit a remote conflict (any policy)
    bool cancelled = false;           ///< Cycle stopped early by request_cancel()
    std::chrono::milliseconds duration{0};
};

/**
 * @brief A conflict left for the user under the manual policy
 *
 * Both versions are kept verbatim so the UI layer can present them.
 */
struct ConflictRecord {
    std::string operation_id;
    std::string entity_type;
    std::string entity_id;
    std::string local_version;
    std::string remote_version;
    TimePoint detected_at{};
};

enum class ConflictChoice {
    UseLocal,
    UseRemote,
    Merge
};

} // namespace ofs::sync
