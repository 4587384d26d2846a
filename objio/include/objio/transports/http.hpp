#pragma once

#include "objio/transport.hpp"
#include <string>

namespace objio {

// HTTP transport configuration
struct HttpConfig {
    std::string endpoint;             // "http://127.0.0.1:9000", no trailing path needed
    std::string username;             // HTTP basic auth, optional
    std::string password;
    long connect_timeout_ms = 10000;
    bool verify_tls = true;
};

// HTTP(S) transport using libcurl
// Objects live at <endpoint>/<container>/<key>. Fetches are streaming GETs with
// "Range: bytes=N-"; metadata queries are HEAD requests.
// Request signing is not done here.
class HttpTransport : public Transport {
public:
    explicit HttpTransport(HttpConfig config);

    std::string name() const override;
    FetchResult fetch_range(const ObjectId& id, uint64_t offset) override;
    ObjectInfo fetch_metadata(const ObjectId& id) override;

    // Percent-encodes each path segment of container and key
    std::string build_url(const ObjectId& id) const;

    const HttpConfig& config() const { return config_; }

private:
    HttpConfig config_;
};

} // namespace objio
