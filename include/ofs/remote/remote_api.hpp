#pragma once

/**
 * @file remote_api.hpp
 * @brief Narrow boundary between the engine and the backend transport
 *
 * The engine never sees HTTP; an adapter implements RemoteApi on top of
 * whatever transport the application uses. Implementations report failures
 * with the engine's ErrorKind taxonomy:
 * - Network / Timeout for transient failures (retried)
 * - Conflict when the entity changed remotely since the mutation was queued
 * - NotFound when the entity no longer exists
 * - Validation for requests the backend rejects outright
 *
 * Mutations carry the operation id so the backend can apply each one at
 * most once; replays after a lost acknowledgement must be harmless.
 */

#include "ofs/core/clock.hpp"
#include "ofs/core/result.hpp"
#include "ofs/upload/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ofs::remote {

struct CallOptions {
    Millis timeout{30'000};
};

enum class MutationMethod {
    Post,
    Put,
    Delete
};

const char* to_string(MutationMethod method) noexcept;

/**
 * @brief One replayed mutation, already mapped to a resource
 */
struct MutationRequest {
    std::string operation_id;
    MutationMethod method = MutationMethod::Post;
    std::string resource;       ///< e.g. "/drafts/42"
    std::string entity_type;
    std::string entity_id;
    std::string body;           ///< Opaque payload from the operation log
    bool force = false;         ///< Overwrite remote changes (local_wins)
};

struct MutationAck {
    std::optional<std::string> data;   ///< Entity as stored remotely, when returned
};

struct UploadSession {
    std::string upload_id;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
};

class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    /**
     * @brief Read a resource; `params_json` holds query parameters
     */
    virtual Result<std::string> fetch(const std::string& resource,
                                      const std::string& params_json,
                                      const CallOptions& options) = 0;

    virtual Result<MutationAck> mutate(const MutationRequest& request, const CallOptions& options) = 0;

    /**
     * @brief Current remote version of one entity; NotFound when deleted
     */
    virtual Result<std::string> fetch_entity(const std::string& entity_type,
                                             const std::string& entity_id,
                                             const CallOptions& options) = 0;

    // ── Chunked upload endpoints ──────────────────────────

    virtual Result<UploadSession> init_upload(const std::string& file_name,
                                              std::uint64_t file_size,
                                              const std::string& mime_type,
                                              std::uint64_t chunk_size,
                                              const CallOptions& options) = 0;

    virtual Result<void> upload_chunk(const std::string& upload_id,
                                      std::uint32_t index,
                                      const std::string& bytes,
                                      const CallOptions& options) = 0;

    virtual Result<upload::FileInfo> complete_upload(const std::string& upload_id,
                                                     const CallOptions& options) = 0;

    virtual Result<void> cancel_upload(const std::string& upload_id, const CallOptions& options) = 0;

    virtual Result<std::vector<std::uint32_t>> list_uploaded_chunks(const std::string& upload_id,
                                                                    const CallOptions& options) = 0;

    /**
     * @brief Single-request upload for files below the chunking threshold
     */
    virtual Result<upload::FileInfo> upload_file(const std::string& file_name,
                                                 const std::string& mime_type,
                                                 const std::string& bytes,
                                                 const CallOptions& options) = 0;
};

} // namespace ofs::remote
