#include "objio/temp_file.hpp"
#include "objio/error.hpp"
#include "objio/log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

namespace objio {

namespace {

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // anonymous namespace

std::unique_ptr<TempFile> TempFile::acquire(const std::filesystem::path& dir, const std::string& prefix) {
    if (prefix.find('/') != std::string::npos) {
        throw ObjError(ErrorCode::InvalidArgument, prefix, "Temp file prefix must not contain '/'");
    }

    // mkstemp rewrites the trailing XXXXXX in place
    std::string templ = (dir / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');

    int fd = ::mkstemp(buffer.data());
    if (fd < 0) {
        throw ObjError(ErrorCode::IOError, dir.string(), errno_message("Failed to create temp file"));
    }

    std::filesystem::path path(buffer.data());
    OBJIO_LOG_VERBOSE("[temp] acquired " << path);
    return std::make_unique<TempFile>(PrivateTag{}, std::move(path), fd);
}

TempFile::TempFile(PrivateTag, std::filesystem::path path, int fd)
    : path_(std::move(path))
    , fd_(fd)
    , owns_file_(true) {}

TempFile::~TempFile() {
    try {
        release();
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[temp] failed to release " << path_ << ": " << e.what());
    }
}

void TempFile::ensure_open(const char* operation) const {
    if (fd_ < 0) {
        throw ObjError(ErrorCode::IOError, path_.string(),
            std::string("Cannot ") + operation + " a released temp file");
    }
}

ReadResult TempFile::read(std::byte* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open("read");

    if (len == 0) {
        return ReadResult{0, false};
    }

    ssize_t n;
    do {
        n = ::read(fd_, buf, len);
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        throw ObjError(ErrorCode::IOError, path_.string(), errno_message("Read failed"));
    }
    return ReadResult{static_cast<size_t>(n), n == 0};
}

void TempFile::write(const std::byte* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open("write");

    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_, buf + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ObjError(ErrorCode::IOError, path_.string(), errno_message("Write failed"));
        }
        written += static_cast<size_t>(n);
    }
}

uint64_t TempFile::seek(int64_t offset, Whence whence) {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open("seek");

    int how = SEEK_SET;
    switch (whence) {
        case Whence::Start:   how = SEEK_SET; break;
        case Whence::Current: how = SEEK_CUR; break;
        case Whence::End:     how = SEEK_END; break;
    }

    off_t pos = ::lseek(fd_, static_cast<off_t>(offset), how);
    if (pos < 0) {
        ErrorCode code = (errno == EINVAL) ? ErrorCode::InvalidArgument : ErrorCode::IOError;
        throw ObjError(code, path_.string(), errno_message("Seek failed"));
    }
    return static_cast<uint64_t>(pos);
}

uint64_t TempFile::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    ensure_open("stat");

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        throw ObjError(ErrorCode::IOError, path_.string(), errno_message("fstat failed"));
    }
    return static_cast<uint64_t>(st.st_size);
}

void TempFile::close() {
    release();
}

void TempFile::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owns_file_) {
        return;
    }

    if (fd_ >= 0) {
        // The descriptor is gone even when close() reports an error
        int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            throw ObjError(ErrorCode::IOError, path_.string(), errno_message("Failed to close temp file"));
        }
    }

    // A file already removed by someone else counts as released
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        throw ObjError(ErrorCode::IOError, path_.string(), "Failed to remove temp file: " + ec.message());
    }

    owns_file_ = false;
    OBJIO_LOG_VERBOSE("[temp] released " << path_);
}

bool TempFile::owned() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owns_file_;
}

size_t sweep_stale_temp_files(const std::filesystem::path& dir, const std::string& prefix) {
    if (prefix.empty()) {
        throw ObjError(ErrorCode::InvalidArgument, dir.string(), "Refusing to sweep with an empty prefix");
    }

    std::error_code ec;
    if (!std::filesystem::exists(dir, ec)) {
        return 0;
    }

    // Collect first, then delete in name order
    std::vector<std::filesystem::path> stale;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        throw ObjError(ErrorCode::IOError, dir.string(), "Failed to list temp directory: " + ec.message());
    }
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw ObjError(ErrorCode::IOError, dir.string(), "Failed to list temp directory: " + ec.message());
        }
        std::string name = it->path().filename().string();
        if (name.compare(0, prefix.size(), prefix) == 0) {
            stale.push_back(it->path());
        }
    }
    if (ec) {
        throw ObjError(ErrorCode::IOError, dir.string(), "Failed to list temp directory: " + ec.message());
    }
    std::sort(stale.begin(), stale.end());

    size_t removed = 0;
    for (const auto& path : stale) {
        std::filesystem::remove(path, ec);
        if (ec) {
            throw ObjError(ErrorCode::IOError, path.string(), "Failed to remove stale temp file: " + ec.message());
        }
        ++removed;
    }

    if (removed > 0) {
        OBJIO_LOG_INFO("[temp] swept " << removed << " stale file(s) matching " << (dir / prefix).string() << "*");
    }
    return removed;
}

} // namespace objio
