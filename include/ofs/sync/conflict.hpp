#pragma once

#include "ofs/core/result.hpp"
#include "ofs/sync/types.hpp"

#include <string>

namespace ofs::sync {

enum class ResolvedSide {
    Local,
    Remote,
    Merged
};

struct ConflictResolutionResult {
    std::string resolved;
    ResolvedSide side = ResolvedSide::Local;
    ConflictPolicy policy = ConflictPolicy::Manual;
};

/**
 * @brief Picks the surviving version of an entity under a conflict policy
 *
 * Payloads are JSON documents. Merge starts from the remote object and
 * applies every field present locally: nested objects merge recursively,
 * arrays are unioned in order without duplicates, any other value is taken
 * from the local side.
 *
 * ERRORS (ErrorKind::Conflict):
 * - Manual: always, the user must choose
 * - Merge: either side is not a JSON object
 */
class ConflictResolver {
public:
    Result<ConflictResolutionResult> resolve(const std::string& local,
                                             const std::string& remote,
                                             ConflictPolicy policy) const;
};

} // namespace ofs::sync
