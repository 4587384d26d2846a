#pragma once

#include "objio/io.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace objio {

// RAII temporary file: <dir>/<prefix>XXXXXX, open for read and write
// The backing file is removed exactly once, by release() or by the destructor.
// Not meant for concurrent read/write sharing; release is safe against concurrent callers.
class TempFile : public ReadSeeker, public ByteSink {
    // Restricts construction to acquire()
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    // Create a uniquely named file in dir (which must already exist)
    // Throws ObjError(IOError) if the file cannot be created,
    // ObjError(InvalidArgument) if prefix contains a path separator
    static std::unique_ptr<TempFile> acquire(const std::filesystem::path& dir, const std::string& prefix);

    TempFile(PrivateTag, std::filesystem::path path, int fd);

    // Destructor: release, logging any failure
    ~TempFile() override;

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&&) = delete;
    TempFile& operator=(TempFile&&) = delete;

    ReadResult read(std::byte* buf, size_t len) override;
    void write(const std::byte* buf, size_t len) override;
    uint64_t seek(int64_t offset, Whence whence) override;
    uint64_t size() override;

    // Same as release()
    void close() override;

    // Close the descriptor and delete the file. No-op once released.
    // On failure ownership is kept, so the call can be retried.
    void release();

    const std::filesystem::path& path() const { return path_; }
    bool owned() const;

private:
    // Throws IOError if already released; mutex_ must be held
    void ensure_open(const char* operation) const;

    std::filesystem::path path_;
    int fd_;
    bool owns_file_;
    mutable std::mutex mutex_;
};

// Delete every entry of dir whose name starts with prefix, in name order.
// Stops at the first failure and throws ObjError(IOError); the remaining entries stay.
// Returns the number of entries deleted (0 if dir doesn't exist).
size_t sweep_stale_temp_files(const std::filesystem::path& dir, const std::string& prefix);

} // namespace objio
