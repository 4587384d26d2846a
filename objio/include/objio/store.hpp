#pragma once

#include "objio/object.hpp"
#include "objio/stream.hpp"
#include "objio/temp_file.hpp"
#include "objio/transport.hpp"
#include "objio/uri.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace objio {

struct TempOptions {
    std::filesystem::path dir;       // staging directory; created if missing
    std::string prefix = "objio-";   // name prefix shared by every temp file of this store
    bool sweep_on_start = true;      // remove <dir>/<prefix>* left by a previous run
};

struct StoreOptions {
    std::filesystem::path base_dir = ".";  // root of the default local transport
    TempOptions temp;                      // temp.dir defaults to <base_dir>/.tmp/objio
};

// Object store front end with prefix-based routing
// @name:container/key routes to the transport configured as "name";
// plain paths go to a local transport rooted at the config directory.
//
// Config format:
//   temp:
//     dir: .tmp/objio        # relative to the config file
//     prefix: objio-
//     sweep_on_start: true
//
//   transports:
//     blobs:
//       type: local
//       root: ./data
//     minio:
//       type: http
//       endpoint: http://127.0.0.1:9000
//       username: user       # optional
//       password: pass
//       connect_timeout_ms: 10000
//       verify_tls: true
class ObjectStore {
public:
    // Create from YAML config file
    // Throws ObjError(ConfigError) on malformed config
    explicit ObjectStore(const std::string& config_path);

    // Create without a config file; add transports with add_transport()
    explicit ObjectStore(StoreOptions options);

    ~ObjectStore();

    // Non-copyable, non-moveable (streams keep references to our transports)
    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;
    ObjectStore(ObjectStore&&) = delete;
    ObjectStore& operator=(ObjectStore&&) = delete;

    // Register (or replace) a named transport, reachable as @name:...
    // Replacing a transport while streams over it are open is undefined.
    void add_transport(const std::string& name, std::unique_ptr<Transport> transport);

    // Lazy stream over the object; no network I/O until the first read.
    // The stream must not outlive the store.
    std::unique_ptr<LazySeekableStream> open(const std::string& uri_str);

    // Metadata query
    ObjectInfo stat(const std::string& uri_str);

    // Fresh temp file in the configured staging directory
    std::unique_ptr<TempFile> create_temp();

    // Staged download: copy the whole object into a temp file, rewound to offset 0.
    // Nothing is left on disk if the copy fails.
    std::unique_ptr<TempFile> download(const std::string& uri_str);

    // Staged download into target, starting at offset. The bytes go to "<target>.part",
    // which is renamed to target only after every byte was written and flushed.
    // On failure neither target nor the .part file is left behind. Returns bytes written.
    uint64_t download_to(const std::string& uri_str, const std::filesystem::path& target, uint64_t offset = 0);

    // Remove stale temp files of this store's prefix. Returns the number removed.
    size_t sweep_temp();

    size_t transport_count() const;
    std::vector<std::string> transport_names() const;
    const TempOptions& temp_options() const { return temp_; }

private:
    void load_config(const std::string& config_path);
    void init_temp_dir();

    // Transport and object id for a URI
    // Throws ConfigError for unknown transports, InvalidURI for URIs without a key
    Transport& route(const URI& uri, ObjectId& id);

    std::unordered_map<std::string, std::unique_ptr<Transport>> transports_;

    // Default transport for plain paths (local, relative to base_dir_)
    std::unique_ptr<Transport> default_transport_;

    std::filesystem::path base_dir_;  // directory containing config file
    TempOptions temp_;
    mutable std::mutex mutex_;        // guards transports_
};

} // namespace objio
