#include "objio/store.hpp"
#include "objio/error.hpp"
#include "objio/log.hpp"
#include "objio/transports/http.hpp"
#include "objio/transports/local.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <utility>

namespace objio {

namespace {

// Byte sink over an output file; throws IOError as soon as the stream goes bad
class FileSink : public ByteSink {
public:
    FileSink(std::ofstream& out, const std::filesystem::path& path) : out_(out), path_(path) {}

    void write(const std::byte* buf, size_t len) override {
        out_.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(len));
        if (!out_) {
            throw ObjError(ErrorCode::IOError, path_.string(), "Failed to write output file");
        }
    }

private:
    std::ofstream& out_;
    const std::filesystem::path& path_;
};

} // anonymous namespace

ObjectStore::ObjectStore(const std::string& config_path) {
    load_config(config_path);
    init_temp_dir();
}

ObjectStore::ObjectStore(StoreOptions options)
    : base_dir_(std::filesystem::weakly_canonical(options.base_dir))
    , temp_(std::move(options.temp)) {
    if (temp_.dir.empty()) {
        temp_.dir = base_dir_ / ".tmp" / "objio";
    } else if (temp_.dir.is_relative()) {
        temp_.dir = base_dir_ / temp_.dir;
    }

    try {
        default_transport_ = std::make_unique<LocalTransport>(base_dir_);
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[store] Failed to create default transport: " << e.what());
    }
    init_temp_dir();
}

ObjectStore::~ObjectStore() = default;

void ObjectStore::load_config(const std::string& config_path) {
    YAML::Node config;
    try {
        config = YAML::LoadFile(config_path);
    } catch (const YAML::Exception& e) {
        throw ObjError(ErrorCode::ConfigError, config_path,
            std::string("Failed to load config: ") + e.what());
    }

    // Store config directory for relative path resolution
    base_dir_ = std::filesystem::path(config_path).parent_path();
    if (base_dir_.empty()) {
        base_dir_ = ".";
    }
    base_dir_ = std::filesystem::weakly_canonical(base_dir_);

    try {
        // Temp staging - default to .tmp/objio next to the config
        temp_.dir = base_dir_ / ".tmp" / "objio";
        if (config["temp"]) {
            const auto& temp_config = config["temp"];
            if (temp_config["dir"]) {
                std::filesystem::path dir = temp_config["dir"].as<std::string>();
                temp_.dir = dir.is_relative() ? base_dir_ / dir : dir;
            }
            temp_.prefix = temp_config["prefix"].as<std::string>(temp_.prefix);
            temp_.sweep_on_start = temp_config["sweep_on_start"].as<bool>(temp_.sweep_on_start);
        }
        temp_.dir = std::filesystem::weakly_canonical(temp_.dir);

        OBJIO_LOG_INFO("[store] Config directory: " << base_dir_);
        OBJIO_LOG_INFO("[store] Temp directory: " << temp_.dir << " (prefix '" << temp_.prefix << "')");

        // Load named transports
        if (config["transports"]) {
            for (const auto& item : config["transports"]) {
                std::string name = item.first.as<std::string>();
                const auto& transport_config = item.second;
                std::string type = transport_config["type"].as<std::string>();

                if (type == "local") {
                    std::filesystem::path root_path(transport_config["root"].as<std::string>());
                    if (root_path.is_relative()) {
                        root_path = base_dir_ / root_path;
                    }

                    try {
                        transports_[name] = std::make_unique<LocalTransport>(root_path);
                        OBJIO_LOG_INFO("[store] Transport '" << name << "': local " << root_path);
                    } catch (const ObjError& e) {
                        OBJIO_LOG_WARN("[store] Failed to add transport '" << name << "': " << e.what());
                    }

                } else if (type == "http") {
                    HttpConfig http_config;
                    http_config.endpoint = transport_config["endpoint"].as<std::string>();
                    http_config.username = transport_config["username"].as<std::string>("");
                    http_config.password = transport_config["password"].as<std::string>("");
                    http_config.connect_timeout_ms =
                        transport_config["connect_timeout_ms"].as<long>(http_config.connect_timeout_ms);
                    http_config.verify_tls = transport_config["verify_tls"].as<bool>(http_config.verify_tls);

                    transports_[name] = std::make_unique<HttpTransport>(http_config);
                    OBJIO_LOG_INFO("[store] Transport '" << name << "': http " << http_config.endpoint);

                } else {
                    OBJIO_LOG_WARN("[store] Unknown transport type '" << type << "' for '" << name << "'");
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw ObjError(ErrorCode::ConfigError, config_path,
            std::string("Invalid config: ") + e.what());
    }

    // Default transport for plain paths (local relative to config dir)
    try {
        default_transport_ = std::make_unique<LocalTransport>(base_dir_);
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[store] Failed to create default transport: " << e.what());
    }

    OBJIO_LOG_INFO("[store] Initialized with " << transports_.size() << " transport(s)");
}

void ObjectStore::init_temp_dir() {
    std::error_code ec;
    std::filesystem::create_directories(temp_.dir, ec);
    if (ec) {
        throw ObjError(ErrorCode::IOError, temp_.dir.string(),
            "Failed to create temp directory: " + ec.message());
    }

    if (temp_.sweep_on_start) {
        sweep_temp();
    }
}

void ObjectStore::add_transport(const std::string& name, std::unique_ptr<Transport> transport) {
    if (!transport) {
        throw ObjError(ErrorCode::InvalidArgument, name, "Transport must not be null");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    OBJIO_LOG_INFO("[store] Transport '" << name << "': " << transport->name());
    transports_[name] = std::move(transport);
}

Transport& ObjectStore::route(const URI& uri, ObjectId& id) {
    if (uri.empty()) {
        throw ObjError(ErrorCode::InvalidURI, "Empty URI");
    }
    if (uri.key().empty()) {
        throw ObjError(ErrorCode::InvalidURI, uri.to_string(), "URI names no object key");
    }
    id = uri.object_id();

    if (!uri.routed()) {
        if (!default_transport_) {
            throw ObjError(ErrorCode::ConfigError, uri.to_string(), "No default transport available");
        }
        return *default_transport_;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transports_.find(uri.transport_name());
    if (it == transports_.end()) {
        throw ObjError(ErrorCode::ConfigError, uri.to_string(),
            "No transport configured for '" + uri.transport() + "'");
    }
    return *it->second;
}

std::unique_ptr<LazySeekableStream> ObjectStore::open(const std::string& uri_str) {
    ObjectId id;
    Transport& transport = route(URI::parse(uri_str), id);
    return std::make_unique<LazySeekableStream>(transport, std::move(id));
}

ObjectInfo ObjectStore::stat(const std::string& uri_str) {
    ObjectId id;
    Transport& transport = route(URI::parse(uri_str), id);
    return transport.fetch_metadata(id);
}

std::unique_ptr<TempFile> ObjectStore::create_temp() {
    return TempFile::acquire(temp_.dir, temp_.prefix);
}

std::unique_ptr<TempFile> ObjectStore::download(const std::string& uri_str) {
    auto stream = open(uri_str);
    auto temp = create_temp();

    // On failure temp goes out of scope and removes its file
    uint64_t copied = copy(*stream, *temp);
    temp->seek(0, Whence::Start);

    OBJIO_LOG_VERBOSE("[store] staged " << copied << " bytes of " << uri_str << " in " << temp->path());
    return temp;
}

uint64_t ObjectStore::download_to(const std::string& uri_str, const std::filesystem::path& target, uint64_t offset) {
    auto staged = download(uri_str);
    staged->seek(static_cast<int64_t>(offset), Whence::Start);

    std::filesystem::path part = target;
    part += ".part";

    uint64_t written = 0;
    try {
        std::ofstream out(part, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ObjError(ErrorCode::IOError, part.string(), "Failed to open output file");
        }
        FileSink sink(out, part);
        written = copy(*staged, sink);
        out.close();
        if (!out) {
            throw ObjError(ErrorCode::IOError, part.string(), "Failed to flush output file");
        }
    } catch (const ObjError&) {
        std::error_code ignored;
        std::filesystem::remove(part, ignored);
        throw;
    }

    std::error_code ec;
    std::filesystem::rename(part, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(part, ignored);
        throw ObjError(ErrorCode::IOError, target.string(), "Failed to move output into place: " + ec.message());
    }

    staged->release();
    OBJIO_LOG_VERBOSE("[store] wrote " << written << " bytes of " << uri_str << " to " << target);
    return written;
}

size_t ObjectStore::sweep_temp() {
    return sweep_stale_temp_files(temp_.dir, temp_.prefix);
}

size_t ObjectStore::transport_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transports_.size();
}

std::vector<std::string> ObjectStore::transport_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(transports_.size());
    for (const auto& item : transports_) {
        names.push_back(item.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace objio
