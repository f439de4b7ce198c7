#pragma once

#include "ofs/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ofs::upload {

/**
 * @brief Read-only byte source for one upload
 *
 * read() may be called concurrently from several chunk lanes.
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual const std::string& name() const = 0;
    virtual std::uint64_t size() const = 0;
    virtual const std::string& mime_type() const = 0;

    /**
     * @brief Read up to `length` bytes starting at `offset`
     *
     * ERRORS: Validation when offset is past the end, Storage on I/O failure
     */
    virtual Result<std::string> read(std::uint64_t offset, std::uint64_t length) const = 0;

    /**
     * @brief Source backed by a file on disk
     *
     * The MIME type is guessed from the extension unless given.
     * ERRORS: NotFound when the path is not a regular file
     */
    static Result<std::shared_ptr<FileSource>> from_path(const std::filesystem::path& path,
                                                        std::optional<std::string> mime_type = std::nullopt);

    static std::shared_ptr<FileSource> from_memory(std::string name, std::string bytes, std::string mime_type);
};

} // namespace ofs::upload
