#include "objio/transports/local.hpp"
#include "objio/error.hpp"
#include "objio/log.hpp"
#include <fstream>
#include <memory>
#include <string>
#include <utility>

namespace objio {

namespace {

// Streams a local file from an offset
class FileByteSource : public ByteSource {
public:
    FileByteSource(const std::filesystem::path& path, uint64_t offset)
        : path_(path)
        , in_(path, std::ios::binary) {
        if (!in_) {
            throw ObjError(ErrorCode::IOError, path_.string(), "Failed to open file for reading");
        }
        in_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!in_) {
            throw ObjError(ErrorCode::IOError, path_.string(), "Failed to seek to offset " + std::to_string(offset));
        }
    }

    ReadResult read(std::byte* buf, size_t len) override {
        if (!in_.is_open()) {
            throw ObjError(ErrorCode::IOError, path_.string(), "Read on closed file source");
        }
        if (len == 0) {
            return ReadResult{0, false};
        }

        in_.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        size_t n = static_cast<size_t>(in_.gcount());
        if (in_.eof()) {
            return ReadResult{n, true};
        }
        if (!in_) {
            throw ObjError(ErrorCode::IOError, path_.string(), "Failed to read file data");
        }
        return ReadResult{n, false};
    }

    void close() override {
        if (in_.is_open()) {
            in_.close();
        }
    }

private:
    std::filesystem::path path_;
    std::ifstream in_;
};

} // anonymous namespace

LocalTransport::LocalTransport(std::filesystem::path root)
    : root_(std::move(root)) {
    // Normalize and verify root exists
    if (!std::filesystem::exists(root_)) {
        throw ObjError(ErrorCode::ConfigError, root_.string(), "Local transport root does not exist");
    }
    root_ = std::filesystem::canonical(root_);
}

std::string LocalTransport::name() const {
    return "local:" + root_.string();
}

std::filesystem::path LocalTransport::resolve(const ObjectId& id) const {
    // Leading '/' on container or key is relative to root; the key always stays under its container
    auto strip_root = [](const std::string& part) {
        size_t begin = part.find_first_not_of('/');
        return begin == std::string::npos ? std::string() : part.substr(begin);
    };
    std::filesystem::path relative = std::filesystem::path(strip_root(id.container)) / strip_root(id.key);
    for (const auto& part : relative) {
        if (part == "..") {
            throw ObjError(ErrorCode::InvalidURI, id.to_string(), "Object key must not contain '..'");
        }
    }
    return root_ / relative.lexically_normal();
}

std::filesystem::path LocalTransport::resolve_file(const ObjectId& id) const {
    auto full_path = resolve(id);

    std::error_code ec;
    if (!std::filesystem::exists(full_path, ec)) {
        throw ObjError(ErrorCode::NotFound, id.to_string(), "Object not found in local transport");
    }
    if (!std::filesystem::is_regular_file(full_path, ec)) {
        throw ObjError(ErrorCode::IOError, id.to_string(), "Path is not a regular file");
    }
    return full_path;
}

FetchResult LocalTransport::fetch_range(const ObjectId& id, uint64_t offset) {
    auto full_path = resolve_file(id);
    ObjectInfo info = fetch_metadata(id);

    OBJIO_LOG_VERBOSE("[local] fetch " << full_path << " from offset " << offset);

    FetchResult result;
    result.info = info;
    if (offset >= info.size) {
        result.source = make_empty_source();
    } else {
        result.source = std::make_unique<FileByteSource>(full_path, offset);
    }
    return result;
}

ObjectInfo LocalTransport::fetch_metadata(const ObjectId& id) {
    auto full_path = resolve_file(id);

    std::error_code ec;
    auto size = std::filesystem::file_size(full_path, ec);
    if (ec) {
        throw ObjError(ErrorCode::IOError, full_path.string(), "Failed to stat file: " + ec.message());
    }

    ObjectInfo info;
    info.size = static_cast<uint64_t>(size);
    return info;
}

} // namespace objio
