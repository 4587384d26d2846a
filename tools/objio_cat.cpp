/**
 * @file objio_cat.cpp
 * @brief Print or stage an object through an objio store
 *
 * Usage:
 *   objio_cat -c objio.yaml @minio:bucket/logs/run.txt
 *   objio_cat -c objio.yaml @minio:bucket/logs/run.txt --offset 1024
 *   objio_cat -c objio.yaml @minio:bucket/model.bin --out model.bin
 *   objio_cat -c objio.yaml @minio:bucket/model.bin --stat
 *   objio_cat -c objio.yaml --sweep
 */

#include "objio/objio.hpp"
#include "objio/log.hpp"

#include <boost/program_options.hpp>
#include <cstdint>
#include <iostream>
#include <string>
#include <utility>

namespace po = boost::program_options;

namespace {

// Writes into a std::ostream; throws IOError when the stream goes bad
class OstreamSink : public objio::ByteSink {
public:
    OstreamSink(std::ostream& out, std::string name) : out_(out), name_(std::move(name)) {}

    void write(const std::byte* buf, size_t len) override {
        out_.write(reinterpret_cast<const char*>(buf), static_cast<std::streamsize>(len));
        if (!out_) {
            throw objio::ObjError(objio::ErrorCode::IOError, name_, "Failed to write output");
        }
    }

private:
    std::ostream& out_;
    std::string name_;
};

// Sends std::cout to stderr while alive so log lines never mix with object bytes
class StdoutRedirect {
public:
    StdoutRedirect() : saved_(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutRedirect() { std::cout.rdbuf(saved_); }

    std::streambuf* original() const { return saved_; }

private:
    std::streambuf* saved_;
};

void printInfo(std::ostream& out, const std::string& uri, const objio::ObjectInfo& info) {
    out << "URI:          " << uri << "\n";
    out << "Size:         " << info.size << " bytes\n";
    out << "Content-Type: " << (info.content_type.empty() ? "(unknown)" : info.content_type) << "\n";
    out << "ETag:         " << (info.etag.empty() ? "(none)" : info.etag) << "\n";
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string uri;
    std::string out_path;
    int64_t offset = 0;
    bool stat_only = false;
    bool sweep_only = false;

    po::options_description desc("objio_cat options");
    desc.add_options()
        ("help,h", "Show help message")
        ("config,c", po::value<std::string>(&config_path)->required(),
         "Path to objio YAML config")
        ("uri", po::value<std::string>(&uri),
         "Object URI (@transport:container/key or a path relative to the config)")
        ("offset", po::value<int64_t>(&offset)->default_value(0),
         "Start streaming at this byte offset")
        ("stat", po::bool_switch(&stat_only),
         "Print size, content type and etag instead of the content")
        ("out,o", po::value<std::string>(&out_path),
         "Write the object to FILE (staged through a temp file)")
        ("sweep", po::bool_switch(&sweep_only),
         "Remove stale temp files and exit");

    po::positional_options_description positional;
    positional.add("uri", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
                      .run(), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0] << " -c CONFIG URI [options]\n\n";
            std::cout << desc << std::endl;
            return 0;
        }

        po::notify(vm);
    } catch (const po::error& e) {
        OBJIO_LOG_ERROR("Command line error: " << e.what());
        std::cout << desc << std::endl;
        return 1;
    }

    if (!sweep_only && uri.empty()) {
        OBJIO_LOG_ERROR("An object URI is required");
        std::cout << desc << std::endl;
        return 1;
    }
    if (offset < 0) {
        OBJIO_LOG_ERROR("--offset must not be negative");
        return 1;
    }

    StdoutRedirect redirect;
    std::ostream content(redirect.original());

    try {
        objio::ObjectStore store(config_path);

        if (sweep_only) {
            size_t removed = store.sweep_temp();
            OBJIO_LOG_INFO("Removed " << removed << " stale temp file(s) from " << store.temp_options().dir);
            return 0;
        }

        if (stat_only) {
            printInfo(content, uri, store.stat(uri));
            content.flush();
            return 0;
        }

        if (!out_path.empty()) {
            // Nothing is written to out_path unless the whole object arrived
            uint64_t written = store.download_to(uri, out_path, static_cast<uint64_t>(offset));
            OBJIO_LOG_INFO("Wrote " << written << " bytes to " << out_path);
            return 0;
        }

        auto stream = store.open(uri);
        if (offset > 0) {
            stream->seek(offset, objio::Whence::Start);
        }
        OstreamSink sink(content, "stdout");
        objio::copy(*stream, sink);
        content.flush();
        return 0;

    } catch (const objio::ObjError& e) {
        OBJIO_LOG_ERROR(e.what());
        return 1;
    }
}
