#pragma once

#include "objio/io.hpp"
#include "objio/object.hpp"
#include "objio/transport.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

namespace objio {

// Seekable stream over a remote object
// Construction does no network I/O. The first read after construction or after
// a seek fetches from the current offset through the end of the object; later
// reads consume that fetch until it ends.
//
// Only absolute seeks (Whence::Start) are supported.
// read/seek/size/close serialize on a per-instance mutex.
// The transport must outlive the stream.
class LazySeekableStream : public ReadSeeker {
public:
    LazySeekableStream(Transport& transport, ObjectId id);

    // Closes a held fetch without draining it
    ~LazySeekableStream() override;

    // Non-copyable, non-moveable (mutex is not moveable)
    LazySeekableStream(const LazySeekableStream&) = delete;
    LazySeekableStream& operator=(const LazySeekableStream&) = delete;
    LazySeekableStream(LazySeekableStream&&) = delete;
    LazySeekableStream& operator=(LazySeekableStream&&) = delete;

    // Read up to len bytes at the current offset.
    // On end-of-object the fetch is drained and closed and eof is set (bytes may be > 0).
    // On a read error the fetch is drained and closed, the offset stays after the
    // last delivered byte, and the error is rethrown.
    // A failed fetch leaves the stream unchanged so the read can be retried.
    ReadResult read(std::byte* buf, size_t len) override;

    // Record a new absolute offset. Closes any held fetch; the next read refetches.
    // Throws Unsupported for Whence::Current/End and InvalidArgument for offset < 0.
    uint64_t seek(int64_t offset, Whence whence) override;

    // Metadata query for the object length. Does not touch offset or fetch state.
    uint64_t size() override;

    // Abandon a held fetch without draining it. Offset is kept.
    void close() override;

    const ObjectId& id() const { return id_; }
    uint64_t position() const;
    bool has_active_fetch() const;

    // Last metadata seen, from size() or from the most recent fetch
    std::optional<ObjectInfo> info() const;

private:
    // No handle held; next read fetches from offset
    struct Idle {
        uint64_t offset = 0;
    };
    // Handle opened at some start and advanced to offset by delivered bytes
    struct Fetching {
        std::unique_ptr<ByteSource> source;
        uint64_t offset = 0;
    };
    // End of object observed at offset; handle already closed
    struct Exhausted {
        uint64_t offset = 0;
    };
    using State = std::variant<Idle, Fetching, Exhausted>;

    static uint64_t offset_of(const State& state);

    // Drain then close; used on eof and error
    void finish(ByteSource& source) const;
    // Close without draining; used on seek/close/destruction
    void abandon(ByteSource& source) const;

    Transport& transport_;
    ObjectId id_;
    State state_;
    std::optional<ObjectInfo> info_;
    mutable std::mutex mutex_;
};

} // namespace objio
