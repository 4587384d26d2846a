#include "objio/io.hpp"
#include <array>

namespace objio {

namespace {

constexpr size_t kCopyBufferSize = 32 * 1024;

class EmptyByteSource : public ByteSource {
public:
    ReadResult read(std::byte*, size_t) override { return ReadResult{0, true}; }
    void close() override {}
};

} // anonymous namespace

const char* whence_to_string(Whence whence) {
    switch (whence) {
        case Whence::Start:   return "start";
        case Whence::Current: return "current";
        case Whence::End:     return "end";
        default:              return "unknown";
    }
}

std::unique_ptr<ByteSource> make_empty_source() {
    return std::make_unique<EmptyByteSource>();
}

uint64_t discard(ByteSource& source) {
    std::array<std::byte, kCopyBufferSize> buffer;
    uint64_t total = 0;
    for (;;) {
        ReadResult r = source.read(buffer.data(), buffer.size());
        total += r.bytes;
        if (r.eof) {
            return total;
        }
    }
}

uint64_t copy(ByteSource& source, ByteSink& sink) {
    std::array<std::byte, kCopyBufferSize> buffer;
    uint64_t total = 0;
    for (;;) {
        ReadResult r = source.read(buffer.data(), buffer.size());
        if (r.bytes > 0) {
            sink.write(buffer.data(), r.bytes);
            total += r.bytes;
        }
        if (r.eof) {
            return total;
        }
    }
}

} // namespace objio
