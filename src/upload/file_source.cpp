#include "ofs/upload/file_source.hpp"

#include "ofs/upload/validation.hpp"

#include <fstream>
#include <system_error>

namespace ofs::upload {
namespace fs = std::filesystem;

namespace {

class PathFileSource final : public FileSource {
public:
    PathFileSource(fs::path path, std::uint64_t size, std::string mime_type)
        : path_(std::move(path)),
          name_(path_.filename().string()),
          size_(size),
          mime_type_(std::move(mime_type)) {}

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return size_; }
    const std::string& mime_type() const override { return mime_type_; }

    Result<std::string> read(std::uint64_t offset, std::uint64_t length) const override {
        if (offset > size_) {
            return Fail<std::string>(ErrorKind::Validation, "read past end of " + name_);
        }

        // One stream per call keeps concurrent readers independent
        std::ifstream input(path_, std::ios::binary);
        if (!input) {
            return Fail<std::string>(ErrorKind::Storage, "failed to open source file: " + path_.string());
        }

        const auto to_read = std::min<std::uint64_t>(length, size_ - offset);
        std::string buffer(static_cast<std::size_t>(to_read), '\0');
        input.seekg(static_cast<std::streamoff>(offset));
        input.read(buffer.data(), static_cast<std::streamsize>(to_read));
        if (static_cast<std::uint64_t>(input.gcount()) != to_read) {
            return Fail<std::string>(ErrorKind::Storage, "short read from " + path_.string());
        }
        return Ok(std::move(buffer));
    }

private:
    fs::path path_;
    std::string name_;
    std::uint64_t size_;
    std::string mime_type_;
};

class MemoryFileSource final : public FileSource {
public:
    MemoryFileSource(std::string name, std::string bytes, std::string mime_type)
        : name_(std::move(name)),
          bytes_(std::move(bytes)),
          mime_type_(std::move(mime_type)) {}

    const std::string& name() const override { return name_; }
    std::uint64_t size() const override { return bytes_.size(); }
    const std::string& mime_type() const override { return mime_type_; }

    Result<std::string> read(std::uint64_t offset, std::uint64_t length) const override {
        if (offset > bytes_.size()) {
            return Fail<std::string>(ErrorKind::Validation, "read past end of " + name_);
        }
        return Ok(bytes_.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length)));
    }

private:
    std::string name_;
    std::string bytes_;
    std::string mime_type_;
};

} // namespace

Result<std::shared_ptr<FileSource>> FileSource::from_path(const fs::path& path, std::optional<std::string> mime_type) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Fail<std::shared_ptr<FileSource>>(ErrorKind::NotFound, "not a regular file: " + path.string());
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Fail<std::shared_ptr<FileSource>>(ErrorKind::Storage,
                                                 "cannot stat " + path.string() + ": " + ec.message());
    }

    std::shared_ptr<FileSource> source = std::make_shared<PathFileSource>(
        path, static_cast<std::uint64_t>(size), mime_type ? *mime_type : mime_type_for(path));
    return Ok(std::move(source));
}

std::shared_ptr<FileSource> FileSource::from_memory(std::string name, std::string bytes, std::string mime_type) {
    return std::make_shared<MemoryFileSource>(std::move(name), std::move(bytes), std::move(mime_type));
}

} // namespace ofs::upload
