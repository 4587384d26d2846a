#pragma once

#include "objio/object.hpp"
#include <string>

namespace objio {

// Object URI with transport routing
// Supports:
//   - Routed objects: "@minio:bucket/photos/cat.jpg", "@blobs/readme.txt"
//   - Relative paths: "data/readme.txt"   (default local transport)
//   - Absolute paths: "/srv/data/readme.txt"
//
// Routing syntax:
//   @transport/key            -> transport="@transport", container="", key="key"
//   @transport:container/key  -> transport="@transport", container="container", key="key"
class URI {
public:
    URI() = default;
    explicit URI(const std::string& str);

    // Parse a string into URI (never throws)
    static URI parse(const std::string& str);

    // Plain path without leading '/', or any routed URI
    bool is_relative() const;
    bool is_absolute() const;

    bool routed() const { return !transport_.empty(); }
    const std::string& transport() const { return transport_; }      // "@minio"
    const std::string& container() const { return container_; }      // "bucket"
    const std::string& key() const { return key_; }                  // "photos/cat.jpg"

    // Name used in configuration: "@minio" -> "minio"
    std::string transport_name() const;

    ObjectId object_id() const { return ObjectId{container_, key_}; }

    std::string to_string() const;

    bool empty() const { return transport_.empty() && container_.empty() && key_.empty(); }

private:
    std::string transport_;  // "@minio", or empty for plain paths
    std::string container_;  // "bucket", or empty
    std::string key_;        // object key, or the plain path
};

} // namespace objio
