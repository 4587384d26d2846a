#pragma once

#include <cstdint>
#include <string>

namespace objio {

// Remote object identity: container (bucket, directory) + key
struct ObjectId {
    std::string container;
    std::string key;

    // "container/key", or just "key" when container is empty
    std::string to_string() const {
        return container.empty() ? key : container + "/" + key;
    }
};

// Object metadata returned by fetches and metadata queries
struct ObjectInfo {
    uint64_t size = 0;
    std::string content_type;  // empty when unknown
    std::string etag;          // empty when unknown, quotes stripped
};

} // namespace objio
