#include "ofs/remote/loopback_remote.hpp"

#include "ofs/core/ids.hpp"

#include <spdlog/spdlog.h>

#include <thread>

namespace ofs::remote {

namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

/**
 * @brief Counts a transfer as in flight for its whole duration
 */
class LoopbackRemoteApi::TransferGuard {
public:
    explicit TransferGuard(LoopbackRemoteApi& api) : api_(api) {
        auto now = ++api_.transfers_in_flight_;
        auto peak = api_.peak_transfers_.load();
        while (now > peak && !api_.peak_transfers_.compare_exchange_weak(peak, now)) {
        }
    }

    ~TransferGuard() { --api_.transfers_in_flight_; }

    TransferGuard(const TransferGuard&) = delete;
    TransferGuard& operator=(const TransferGuard&) = delete;

private:
    LoopbackRemoteApi& api_;
};

void LoopbackRemoteApi::set_online(bool online) {
    std::lock_guard lock(mutex_);
    online_ = online;
}

bool LoopbackRemoteApi::online() const {
    std::lock_guard lock(mutex_);
    return online_;
}

void LoopbackRemoteApi::set_latency(Millis latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

void LoopbackRemoteApi::fail_next(const std::string& call, Error error, std::size_t times) {
    std::lock_guard lock(mutex_);
    auto& queue = injected_[call];
    for (std::size_t i = 0; i < times; ++i) {
        queue.push_back(error);
    }
}

void LoopbackRemoteApi::put_resource(const std::string& resource, std::string payload) {
    std::lock_guard lock(mutex_);
    resources_[resource] = std::move(payload);
}

void LoopbackRemoteApi::put_entity(const std::string& entity_type, const std::string& entity_id, std::string data) {
    std::lock_guard lock(mutex_);
    entities_[key_for(entity_type, entity_id)] = std::move(data);
}

void LoopbackRemoteApi::inject_conflict(const std::string& entity_type,
                                        const std::string& entity_id,
                                        std::string remote_version) {
    std::lock_guard lock(mutex_);
    auto key = key_for(entity_type, entity_id);
    entities_[key] = std::move(remote_version);
    conflicted_.insert(key);
}

std::optional<std::string> LoopbackRemoteApi::entity(const std::string& entity_type,
                                                     const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto it = entities_.find(key_for(entity_type, entity_id));
    if (it == entities_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> LoopbackRemoteApi::stored_file(const std::string& file_id) const {
    std::lock_guard lock(mutex_);
    auto it = files_.find(file_id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> LoopbackRemoteApi::attachments(const std::string& entity_type,
                                                        const std::string& entity_id) const {
    std::lock_guard lock(mutex_);
    auto it = attachments_.find(key_for(entity_type, entity_id));
    if (it == attachments_.end()) {
        return {};
    }
    return it->second;
}

std::vector<std::string> LoopbackRemoteApi::call_log() const {
    std::lock_guard lock(mutex_);
    return call_log_;
}

std::vector<std::string> LoopbackRemoteApi::applied_operations() const {
    std::lock_guard lock(mutex_);
    return applied_order_;
}

std::size_t LoopbackRemoteApi::call_count(const std::string& call) const {
    std::lock_guard lock(mutex_);
    std::size_t count = 0;
    for (const auto& entry : call_log_) {
        if (entry.compare(0, call.size(), call) == 0 &&
            (entry.size() == call.size() || entry[call.size()] == ' ')) {
            ++count;
        }
    }
    return count;
}

Result<void> LoopbackRemoteApi::begin_call(const std::string& call, const std::string& detail) {
    Millis latency{0};
    {
        std::lock_guard lock(mutex_);
        call_log_.push_back(detail.empty() ? call : call + " " + detail);
        latency = latency_;
    }

    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }

    std::lock_guard lock(mutex_);
    if (!online_) {
        return Fail<void>(ErrorKind::Network, "loopback: network unreachable");
    }
    auto it = injected_.find(call);
    if (it != injected_.end() && !it->second.empty()) {
        Error error = it->second.front();
        it->second.erase(it->second.begin());
        return Err<void>(error);
    }
    return Ok();
}

Result<std::string> LoopbackRemoteApi::fetch(const std::string& resource,
                                             const std::string& params_json,
                                             const CallOptions&) {
    auto gate = begin_call("fetch", resource + (params_json.empty() ? "" : " " + params_json));
    if (gate.is_error()) {
        return Err<std::string>(gate.error());
    }

    std::lock_guard lock(mutex_);
    auto it = resources_.find(resource);
    if (it == resources_.end()) {
        return Fail<std::string>(ErrorKind::NotFound, "no resource " + resource);
    }
    return Ok(it->second);
}

Result<MutationAck> LoopbackRemoteApi::mutate(const MutationRequest& request, const CallOptions&) {
    auto gate = begin_call("mutate", std::string(to_string(request.method)) + " " + request.resource);
    if (gate.is_error()) {
        return Err<MutationAck>(gate.error());
    }

    std::lock_guard lock(mutex_);
    auto seen = applied_.find(request.operation_id);
    if (seen != applied_.end()) {
        return Ok(seen->second);
    }

    auto key = key_for(request.entity_type, request.entity_id);
    if (!request.force && conflicted_.count(key) > 0) {
        return Fail<MutationAck>(ErrorKind::Conflict, "entity " + key + " was modified remotely");
    }

    MutationAck ack;
    switch (request.method) {
        case MutationMethod::Post:
            if (ends_with(request.resource, "/images")) {
                if (entities_.count(key) == 0) {
                    return Fail<MutationAck>(ErrorKind::NotFound, "entity " + key + " does not exist");
                }
                attachments_[key].push_back(request.body);
                break;
            }
            entities_[key] = request.body;
            ack.data = request.body;
            break;
        case MutationMethod::Put:
            if (entities_.count(key) == 0) {
                return Fail<MutationAck>(ErrorKind::NotFound, "entity " + key + " does not exist");
            }
            entities_[key] = request.body;
            ack.data = request.body;
            break;
        case MutationMethod::Delete:
            if (entities_.erase(key) == 0) {
                return Fail<MutationAck>(ErrorKind::NotFound, "entity " + key + " does not exist");
            }
            break;
    }

    conflicted_.erase(key);
    applied_[request.operation_id] = ack;
    applied_order_.push_back(request.operation_id);
    return Ok(ack);
}

Result<std::string> LoopbackRemoteApi::fetch_entity(const std::string& entity_type,
                                                    const std::string& entity_id,
                                                    const CallOptions&) {
    auto key = key_for(entity_type, entity_id);
    auto gate = begin_call("fetch_entity", key);
    if (gate.is_error()) {
        return Err<std::string>(gate.error());
    }

    std::lock_guard lock(mutex_);
    auto it = entities_.find(key);
    if (it == entities_.end()) {
        return Fail<std::string>(ErrorKind::NotFound, "entity " + key + " does not exist");
    }
    return Ok(it->second);
}

Result<UploadSession> LoopbackRemoteApi::init_upload(const std::string& file_name,
                                                     std::uint64_t file_size,
                                                     const std::string& mime_type,
                                                     std::uint64_t chunk_size,
                                                     const CallOptions&) {
    auto gate = begin_call("init_upload", file_name);
    if (gate.is_error()) {
        return Err<UploadSession>(gate.error());
    }
    if (chunk_size == 0) {
        return Fail<UploadSession>(ErrorKind::Validation, "chunk size must be positive");
    }

    ChunkSession session;
    session.file_name = file_name;
    session.file_size = file_size;
    session.mime_type = mime_type;
    session.chunk_size = chunk_size;
    session.total_chunks = static_cast<std::uint32_t>((file_size + chunk_size - 1) / chunk_size);

    UploadSession result{generate_id("upload"), chunk_size, session.total_chunks};
    std::lock_guard lock(mutex_);
    sessions_[result.upload_id] = std::move(session);
    return Ok(result);
}

Result<void> LoopbackRemoteApi::upload_chunk(const std::string& upload_id,
                                             std::uint32_t index,
                                             const std::string& bytes,
                                             const CallOptions&) {
    TransferGuard guard(*this);
    auto gate = begin_call("upload_chunk", upload_id + "#" + std::to_string(index));
    if (gate.is_error()) {
        return gate;
    }

    std::lock_guard lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return Fail<void>(ErrorKind::NotFound, "no upload session " + upload_id);
    }
    if (index >= it->second.total_chunks) {
        return Fail<void>(ErrorKind::Validation, "chunk index " + std::to_string(index) + " out of range");
    }
    it->second.chunks[index] = bytes;
    return Ok();
}

Result<upload::FileInfo> LoopbackRemoteApi::complete_upload(const std::string& upload_id, const CallOptions&) {
    auto gate = begin_call("complete_upload", upload_id);
    if (gate.is_error()) {
        return Err<upload::FileInfo>(gate.error());
    }

    ChunkSession session;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(upload_id);
        if (it == sessions_.end()) {
            return Fail<upload::FileInfo>(ErrorKind::NotFound, "no upload session " + upload_id);
        }
        if (it->second.chunks.size() != it->second.total_chunks) {
            return Fail<upload::FileInfo>(ErrorKind::Validation,
                                          "upload " + upload_id + " is missing " +
                                          std::to_string(it->second.total_chunks - it->second.chunks.size()) +
                                          " chunks");
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    std::string merged;
    merged.reserve(session.file_size);
    for (auto& [index, bytes] : session.chunks) {
        merged += bytes;
    }
    return Ok(store_file(session.file_name, session.mime_type, std::move(merged)));
}

Result<void> LoopbackRemoteApi::cancel_upload(const std::string& upload_id, const CallOptions&) {
    auto gate = begin_call("cancel_upload", upload_id);
    if (gate.is_error()) {
        return gate;
    }
    std::lock_guard lock(mutex_);
    sessions_.erase(upload_id);
    return Ok();
}

Result<std::vector<std::uint32_t>> LoopbackRemoteApi::list_uploaded_chunks(const std::string& upload_id,
                                                                           const CallOptions&) {
    auto gate = begin_call("list_uploaded_chunks", upload_id);
    if (gate.is_error()) {
        return Err<std::vector<std::uint32_t>>(gate.error());
    }

    std::lock_guard lock(mutex_);
    auto it = sessions_.find(upload_id);
    if (it == sessions_.end()) {
        return Fail<std::vector<std::uint32_t>>(ErrorKind::NotFound, "no upload session " + upload_id);
    }
    std::vector<std::uint32_t> indices;
    for (const auto& [index, bytes] : it->second.chunks) {
        indices.push_back(index);
    }
    return Ok(std::move(indices));
}

Result<upload::FileInfo> LoopbackRemoteApi::upload_file(const std::string& file_name,
                                                        const std::string& mime_type,
                                                        const std::string& bytes,
                                                        const CallOptions&) {
    TransferGuard guard(*this);
    auto gate = begin_call("upload_file", file_name);
    if (gate.is_error()) {
        return Err<upload::FileInfo>(gate.error());
    }
    return Ok(store_file(file_name, mime_type, bytes));
}

upload::FileInfo LoopbackRemoteApi::store_file(const std::string& name, const std::string& mime_type,
                                               std::string bytes) {
    upload::FileInfo info;
    info.file_id = generate_id("file");
    info.name = name;
    info.url = "/files/" + info.file_id;
    info.size = bytes.size();
    info.mime_type = mime_type;

    std::lock_guard lock(mutex_);
    files_[info.file_id] = std::move(bytes);
    spdlog::debug("Loopback stored {} ({} bytes) as {}", name, info.size, info.file_id);
    return info;
}

std::string LoopbackRemoteApi::key_for(const std::string& entity_type, const std::string& entity_id) {
    return entity_type + ":" + entity_id;
}

} // namespace ofs::remote
