#pragma once

#include "ofs/core/result.hpp"
#include "ofs/upload/types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace ofs::upload {

/**
 * @brief Category of a supported MIME type, nullopt when unsupported
 */
std::optional<FileCategory> categorize(const std::string& mime_type);

/**
 * @brief Size ceiling for a category
 *
 * image 10 MiB, video 500 MiB, audio 100 MiB, document 50 MiB,
 * archive 100 MiB, code and anything else 20 MiB
 */
std::uint64_t max_size_for(FileCategory category) noexcept;

/**
 * @brief Reject a file before any network call
 *
 * ERRORS (ErrorKind::Validation): unsupported MIME type, empty file,
 * file larger than its category allows
 */
Result<FileCategory> validate_file(const std::string& file_name,
                                   std::uint64_t size,
                                   const std::string& mime_type);

/**
 * @brief Best-effort MIME type from a file extension
 *
 * Returns "application/octet-stream" for unknown extensions.
 */
std::string mime_type_for(const std::filesystem::path& path);

} // namespace ofs::upload
