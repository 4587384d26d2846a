#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace objio {

// Outcome of a single read call.
// eof may be reported together with bytes > 0 on the final read.
struct ReadResult {
    size_t bytes = 0;
    bool eof = false;
};

enum class Whence {
    Start,    // absolute offset from the beginning
    Current,  // relative to the current position
    End       // relative to the end
};

const char* whence_to_string(Whence whence);

// Sequential byte source
// Implementations throw ObjError on failure
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Copy up to len bytes into buf
    virtual ReadResult read(std::byte* buf, size_t len) = 0;

    // Release the underlying handle. Must be callable before the source is drained
    // and more than once.
    virtual void close() = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Write all len bytes or throw
    virtual void write(const std::byte* buf, size_t len) = 0;
};

// Byte source that can be repositioned and knows its total size
class ReadSeeker : public ByteSource {
public:
    // Returns the new absolute offset
    virtual uint64_t seek(int64_t offset, Whence whence) = 0;

    virtual uint64_t size() = 0;
};

// Source that reports eof on its first read (offsets at or past the end of an object)
std::unique_ptr<ByteSource> make_empty_source();

// Read and throw away everything left in source. Returns bytes discarded.
uint64_t discard(ByteSource& source);

// Copy source into sink until end-of-stream. Returns bytes copied.
uint64_t copy(ByteSource& source, ByteSink& sink);

} // namespace objio
