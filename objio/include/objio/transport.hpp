#pragma once

#include "objio/io.hpp"
#include "objio/object.hpp"
#include <memory>
#include <string>

namespace objio {

struct FetchResult {
    std::unique_ptr<ByteSource> source;
    ObjectInfo info;
};

// Abstract transport interface
// Implementations provide offset fetches and metadata queries against one storage service
class Transport {
public:
    virtual ~Transport() = default;

    // Human-readable name for logging/debugging
    virtual std::string name() const = 0;

    // Start fetching the object from offset through its end.
    // An offset at or past the end yields a source that reports eof immediately.
    // The returned source may be closed before it is drained.
    // Throws ObjError on failure
    virtual FetchResult fetch_range(const ObjectId& id, uint64_t offset) = 0;

    // Query object metadata without transferring object bytes
    // Throws ObjError on failure
    virtual ObjectInfo fetch_metadata(const ObjectId& id) = 0;
};

} // namespace objio
