#pragma once

/**
 * @file loopback_remote.hpp
 * @brief In-process RemoteApi backed by memory, for tests and the demo
 *
 * Behaves like a well-formed backend: mutations are idempotent per
 * operation id, PUT/DELETE on a missing entity return NotFound, chunk
 * sessions refuse to complete until every index arrived.
 *
 * Fault injection:
 * - set_online(false): every call fails with a Network error
 * - fail_next(call, error, times): the next `times` calls named `call` fail
 * - inject_conflict(type, id, remote): the next non-forced mutation of the
 *   entity fails with Conflict and the remote copy becomes `remote`
 * - set_latency(): each call blocks, making concurrency observable
 */

#include "ofs/remote/remote_api.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace ofs::remote {

class LoopbackRemoteApi final : public RemoteApi {
public:
    LoopbackRemoteApi() = default;

    // ── Control ───────────────────────────────────────────

    void set_online(bool online);
    bool online() const;
    void set_latency(Millis latency);
    void fail_next(const std::string& call, Error error, std::size_t times = 1);

    void put_resource(const std::string& resource, std::string payload);
    void put_entity(const std::string& entity_type, const std::string& entity_id, std::string data);
    void inject_conflict(const std::string& entity_type, const std::string& entity_id, std::string remote_version);

    // ── Inspection ────────────────────────────────────────

    std::optional<std::string> entity(const std::string& entity_type, const std::string& entity_id) const;
    std::optional<std::string> stored_file(const std::string& file_id) const;
    std::vector<std::string> attachments(const std::string& entity_type, const std::string& entity_id) const;
    std::vector<std::string> call_log() const;
    std::vector<std::string> applied_operations() const;
    std::size_t call_count(const std::string& call) const;
    std::size_t peak_transfers_in_flight() const { return peak_transfers_.load(); }
    std::size_t transfers_in_flight() const { return transfers_in_flight_.load(); }

    // ── RemoteApi ─────────────────────────────────────────

    Result<std::string> fetch(const std::string& resource,
                              const std::string& params_json,
                              const CallOptions& options) override;

    Result<MutationAck> mutate(const MutationRequest& request, const CallOptions& options) override;

    Result<std::string> fetch_entity(const std::string& entity_type,
                                     const std::string& entity_id,
                                     const CallOptions& options) override;

    Result<UploadSession> init_upload(const std::string& file_name,
                                      std::uint64_t file_size,
                                      const std::string& mime_type,
                                      std::uint64_t chunk_size,
                                      const CallOptions& options) override;

    Result<void> upload_chunk(const std::string& upload_id,
                              std::uint32_t index,
                              const std::string& bytes,
                              const CallOptions& options) override;

    Result<upload::FileInfo> complete_upload(const std::string& upload_id, const CallOptions& options) override;

    Result<void> cancel_upload(const std::string& upload_id, const CallOptions& options) override;

    Result<std::vector<std::uint32_t>> list_uploaded_chunks(const std::string& upload_id,
                                                            const CallOptions& options) override;

    Result<upload::FileInfo> upload_file(const std::string& file_name,
                                         const std::string& mime_type,
                                         const std::string& bytes,
                                         const CallOptions& options) override;

private:
    struct ChunkSession {
        std::string file_name;
        std::uint64_t file_size = 0;
        std::string mime_type;
        std::uint64_t chunk_size = 0;
        std::uint32_t total_chunks = 0;
        std::map<std::uint32_t, std::string> chunks;
    };

    /**
     * @brief Common prologue: log, latency, offline check, injected failure
     */
    Result<void> begin_call(const std::string& call, const std::string& detail);
    upload::FileInfo store_file(const std::string& name, const std::string& mime_type, std::string bytes);
    static std::string key_for(const std::string& entity_type, const std::string& entity_id);

    class TransferGuard;

    mutable std::mutex mutex_;
    bool online_ = true;
    Millis latency_{0};
    std::unordered_map<std::string, std::vector<Error>> injected_;
    std::vector<std::string> call_log_;

    std::unordered_map<std::string, std::string> resources_;
    std::unordered_map<std::string, std::string> entities_;
    std::set<std::string> conflicted_;
    std::unordered_map<std::string, std::vector<std::string>> attachments_;
    std::unordered_map<std::string, MutationAck> applied_;
    std::vector<std::string> applied_order_;

    std::unordered_map<std::string, ChunkSession> sessions_;
    std::unordered_map<std::string, std::string> files_;

    std::atomic<std::size_t> transfers_in_flight_{0};
    std::atomic<std::size_t> peak_transfers_{0};
};

} // namespace ofs::remote
