#include "ofs/sync/types.hpp"

namespace ofs::sync {

const char* to_string(ConflictPolicy policy) noexcept {
    switch (policy) {
        case ConflictPolicy::Manual: return "manual";
        case ConflictPolicy::LocalWins: return "local_wins";
        case ConflictPolicy::RemoteWins: return "remote_wins";
        case ConflictPolicy::Merge: return "merge";
    }
    return "manual";
}

std::optional<ConflictPolicy> parse_conflict_policy(const std::string& text) {
    if (text == "manual") return ConflictPolicy::Manual;
    if (text == "local_wins") return ConflictPolicy::LocalWins;
    if (text == "remote_wins") return ConflictPolicy::RemoteWins;
    if (text == "merge") return ConflictPolicy::Merge;
    return std::nullopt;
}

const char* to_string(SyncState state) noexcept {
    switch (state) {
        case SyncState::Idle: return "idle";
        case SyncState::Draining: return "draining";
        case SyncState::Replaying: return "replaying";
    }
    return "idle";
}

} // namespace ofs::sync
