#include "objio/stream.hpp"
#include "objio/error.hpp"
#include "objio/log.hpp"
#include <string>
#include <utility>

namespace objio {

LazySeekableStream::LazySeekableStream(Transport& transport, ObjectId id)
    : transport_(transport)
    , id_(std::move(id))
    , state_(Idle{0})
    , info_() {}

LazySeekableStream::~LazySeekableStream() {
    if (auto* fetching = std::get_if<Fetching>(&state_)) {
        abandon(*fetching->source);
    }
}

uint64_t LazySeekableStream::offset_of(const State& state) {
    return std::visit([](const auto& s) { return s.offset; }, state);
}

void LazySeekableStream::finish(ByteSource& source) const {
    try {
        uint64_t discarded = discard(source);
        if (discarded > 0) {
            OBJIO_LOG_VERBOSE("[stream] discarded " << discarded << " trailing bytes of " << id_.to_string());
        }
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[stream] drain failed for " << id_.to_string() << ": " << e.what());
    }
    abandon(source);
}

void LazySeekableStream::abandon(ByteSource& source) const {
    try {
        source.close();
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[stream] close failed for " << id_.to_string() << ": " << e.what());
    }
}

ReadResult LazySeekableStream::read(std::byte* buf, size_t len) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (std::holds_alternative<Exhausted>(state_)) {
        return ReadResult{0, true};
    }
    if (len == 0) {
        return ReadResult{0, false};
    }

    if (auto* idle = std::get_if<Idle>(&state_)) {
        uint64_t offset = idle->offset;
        OBJIO_LOG_VERBOSE("[stream] fetching " << id_.to_string() << " from offset " << offset
                          << " via " << transport_.name());

        // Throws before any state change: the caller may retry
        FetchResult fetched = transport_.fetch_range(id_, offset);
        if (!fetched.source) {
            throw ObjError(ErrorCode::NetworkError, id_.to_string(),
                "Transport " + transport_.name() + " returned no byte source");
        }
        info_ = fetched.info;
        state_ = Fetching{std::move(fetched.source), offset};
    }

    auto& fetching = std::get<Fetching>(state_);
    ReadResult result;
    try {
        result = fetching.source->read(buf, len);
    } catch (const ObjError& e) {
        uint64_t offset = fetching.offset;
        OBJIO_LOG_WARN("[stream] read failed for " << id_.to_string() << " at offset " << offset
                       << ": " << e.what());
        finish(*fetching.source);
        state_ = Idle{offset};
        throw;
    }

    fetching.offset += result.bytes;
    if (result.eof) {
        uint64_t offset = fetching.offset;
        finish(*fetching.source);
        state_ = Exhausted{offset};
        OBJIO_LOG_VERBOSE("[stream] end of " << id_.to_string() << " at offset " << offset);
    }
    return result;
}

uint64_t LazySeekableStream::seek(int64_t offset, Whence whence) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (whence != Whence::Start) {
        throw ObjError(ErrorCode::Unsupported, id_.to_string(),
            std::string("Seek relative to ") + whence_to_string(whence) + " is not supported");
    }
    if (offset < 0) {
        throw ObjError(ErrorCode::InvalidArgument, id_.to_string(),
            "Negative seek offset " + std::to_string(offset));
    }

    if (auto* fetching = std::get_if<Fetching>(&state_)) {
        OBJIO_LOG_VERBOSE("[stream] seek drops fetch of " << id_.to_string() << " at offset " << fetching->offset);
        abandon(*fetching->source);
    }
    state_ = Idle{static_cast<uint64_t>(offset)};
    return static_cast<uint64_t>(offset);
}

uint64_t LazySeekableStream::size() {
    std::lock_guard<std::mutex> lock(mutex_);

    ObjectInfo info = transport_.fetch_metadata(id_);
    info_ = info;
    return info.size;
}

void LazySeekableStream::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto* fetching = std::get_if<Fetching>(&state_)) {
        uint64_t offset = fetching->offset;
        abandon(*fetching->source);
        state_ = Idle{offset};
    }
}

uint64_t LazySeekableStream::position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return offset_of(state_);
}

bool LazySeekableStream::has_active_fetch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::holds_alternative<Fetching>(state_);
}

std::optional<ObjectInfo> LazySeekableStream::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return info_;
}

} // namespace objio
