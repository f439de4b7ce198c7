#include "ofs/sync/conflict.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <string>

namespace ofs::sync {
namespace {

using json = nlohmann::json;

json union_arrays(const json& remote, const json& local) {
    json merged = remote;
    for (const auto& item : local) {
        if (std::find(merged.begin(), merged.end(), item) == merged.end()) {
            merged.push_back(item);
        }
    }
    return merged;
}

json merge_objects(const json& remote, const json& local) {
    json merged = remote;
    for (auto it = local.begin(); it != local.end(); ++it) {
        auto existing = merged.find(it.key());
        if (existing == merged.end()) {
            merged[it.key()] = it.value();
        } else if (existing->is_array() && it.value().is_array()) {
            *existing = union_arrays(*existing, it.value());
        } else if (existing->is_object() && it.value().is_object()) {
            *existing = merge_objects(*existing, it.value());
        } else {
            *existing = it.value();
        }
    }
    return merged;
}

} // namespace

Result<ConflictResolutionResult> ConflictResolver::resolve(const std::string& local,
                                                           const std::string& remote,
                                                           ConflictPolicy policy) const {
    if (policy == ConflictPolicy::LocalWins) {
        return Ok(ConflictResolutionResult{local, ResolvedSide::Local, policy});
    }

    if (policy == ConflictPolicy::RemoteWins) {
        return Ok(ConflictResolutionResult{remote, ResolvedSide::Remote, policy});
    }

    if (policy == ConflictPolicy::Manual) {
        return Fail<ConflictResolutionResult>(ErrorKind::Conflict, "manual resolution required");
    }

    json local_doc = json::parse(local, nullptr, false);
    json remote_doc = json::parse(remote, nullptr, false);
    if (local_doc.is_discarded() || !local_doc.is_object()) {
        return Fail<ConflictResolutionResult>(ErrorKind::Conflict, "cannot merge: local version is not a JSON object");
    }
    if (remote_doc.is_discarded() || !remote_doc.is_object()) {
        return Fail<ConflictResolutionResult>(ErrorKind::Conflict, "cannot merge: remote version is not a JSON object");
    }

    return Ok(ConflictResolutionResult{merge_objects(remote_doc, local_doc).dump(), ResolvedSide::Merged, policy});
}

} // namespace ofs::sync
