#pragma once

#include "ofs/core/clock.hpp"
#include "ofs/core/error.hpp"

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace ofs::upload {

/**
 * Task lifecycle:
 *
 *   Pending -> Uploading <-> Paused
 *                  |
 *                  +-> Completed | Failed | Cancelled
 *
 * Paused -> Pending on resume, Failed -> Pending on retry (bounded).
 */
enum class UploadStatus {
    Pending,
    Uploading,
    Paused,
    Completed,
    Failed,
    Cancelled
};

const char* to_string(UploadStatus status) noexcept;

inline bool is_finished(UploadStatus status) noexcept {
    return status == UploadStatus::Completed ||
           status == UploadStatus::Failed ||
           status == UploadStatus::Cancelled;
}

enum class FileCategory {
    Image,
    Video,
    Audio,
    Document,
    Archive,
    Code,
    Other
};

const char* to_string(FileCategory category) noexcept;

/**
 * @brief Remote descriptor of a stored file
 */
struct FileInfo {
    std::string file_id;
    std::string name;
    std::string url;
    std::uint64_t size = 0;
    std::string mime_type;
};

struct ChunkInfo {
    std::string upload_id;
    std::uint32_t total_chunks = 0;
    std::uint64_t chunk_size = 0;
    std::set<std::uint32_t> uploaded_chunks;

    bool all_present() const { return uploaded_chunks.size() == total_chunks; }
};

struct AttachTarget {
    std::string entity_type;
    std::string entity_id;
};

struct UploadOptions {
    std::optional<AttachTarget> attach_to;
    std::optional<std::uint64_t> chunk_size;   ///< Overrides upload.chunk_size
    bool force_chunked = false;                ///< Chunk even below the threshold
    bool auto_start = true;                    ///< false: stay Pending until start_task()
};

struct UploadTask {
    std::string id;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string mime_type;
    FileCategory category = FileCategory::Other;
    UploadStatus status = UploadStatus::Pending;

    double progress = 0.0;                 ///< 0-100
    std::uint64_t uploaded_bytes = 0;
    double speed = 0.0;                    ///< bytes per second over the current run
    std::optional<Millis> remaining_time;  ///< Unknown until speed > 0

    std::optional<ChunkInfo> chunk_info;
    std::uint32_t retry_count = 0;
    std::uint32_t max_retries = 0;

    std::optional<FileInfo> result;
    std::optional<Error> error;
    std::optional<AttachTarget> attach_to;

    TimePoint created_at{};
    std::optional<TimePoint> completed_at;
};

/**
 * @brief Aggregate counters, persisted across restarts
 */
struct UploadStats {
    std::uint64_t files_completed = 0;
    std::uint64_t files_failed = 0;
    std::uint64_t files_cancelled = 0;
    std::uint64_t bytes_uploaded = 0;
};

} // namespace ofs::upload
