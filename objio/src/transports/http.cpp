#include "objio/transports/http.hpp"
#include "objio/error.hpp"
#include "objio/log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <map>
#include <memory>
#include <utility>

namespace objio {

namespace {

constexpr int kWaitTimeoutMs = 1000;

// RAII wrapper for CURL easy handle
class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {
        if (!curl_) {
            throw ObjError(ErrorCode::NetworkError, "Failed to initialize CURL");
        }
    }
    ~CurlHandle() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return curl_; }

private:
    CURL* curl_;
};

// RAII wrapper for CURL multi handle
class CurlMultiHandle {
public:
    CurlMultiHandle() : multi_(curl_multi_init()) {
        if (!multi_) {
            throw ObjError(ErrorCode::NetworkError, "Failed to initialize CURL multi handle");
        }
    }
    ~CurlMultiHandle() {
        if (multi_) {
            curl_multi_cleanup(multi_);
        }
    }
    CurlMultiHandle(const CurlMultiHandle&) = delete;
    CurlMultiHandle& operator=(const CurlMultiHandle&) = delete;

    CURLM* get() { return multi_; }

private:
    CURLM* multi_;
};

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// Header block of the final response (redirects and 100-continue start a new block)
struct ResponseHeaders {
    long status = 0;
    bool complete = false;
    std::map<std::string, std::string> fields;  // lower-case names

    void on_line(const char* data, size_t len) {
        std::string line(data, len);
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }

        if (line.compare(0, 5, "HTTP/") == 0) {
            fields.clear();
            complete = false;
            size_t space = line.find(' ');
            status = (space == std::string::npos) ? 0 : std::strtol(line.c_str() + space + 1, nullptr, 10);
            return;
        }
        if (line.empty()) {
            if (status >= 200 && status < 300) {
                complete = true;
            }
            return;
        }

        size_t colon = line.find(':');
        if (colon != std::string::npos) {
            fields[to_lower(line.substr(0, colon))] = trim(line.substr(colon + 1));
        }
    }

    std::string get(const std::string& name) const {
        auto it = fields.find(name);
        return it == fields.end() ? std::string() : it->second;
    }
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    static_cast<ResponseHeaders*>(userdata)->on_line(buffer, total_size);
    return total_size;
}

size_t body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userdata)->append(ptr, total_size);
    return total_size;
}

ErrorCode code_for_status(long status) {
    switch (status) {
        case 404: return ErrorCode::NotFound;
        case 401:
        case 403: return ErrorCode::AccessDenied;
        default:  return ErrorCode::NetworkError;
    }
}

ObjectInfo info_from_headers(const ResponseHeaders& headers, uint64_t offset) {
    ObjectInfo info;

    // "Content-Range: bytes 10-99/100" or "bytes */100" carries the full size
    std::string range = headers.get("content-range");
    size_t slash = range.rfind('/');
    if (slash != std::string::npos && range.compare(slash + 1, std::string::npos, "*") != 0) {
        info.size = std::strtoull(range.c_str() + slash + 1, nullptr, 10);
    } else {
        std::string length = headers.get("content-length");
        if (!length.empty()) {
            info.size = offset + std::strtoull(length.c_str(), nullptr, 10);
        }
    }

    info.content_type = headers.get("content-type");
    info.etag = headers.get("etag");
    if (info.etag.size() >= 2 && info.etag.front() == '"' && info.etag.back() == '"') {
        info.etag = info.etag.substr(1, info.etag.size() - 2);
    }
    return info;
}

void apply_common_options(CURL* curl, const HttpConfig& config, const std::string& url, char* error_buffer) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, config.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer);

    if (!config.verify_tls) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!config.username.empty()) {
        std::string userpass = config.username + ":" + config.password;
        curl_easy_setopt(curl, CURLOPT_USERPWD, userpass.c_str());
    }
}

ObjError transfer_error(CURL* curl, CURLcode code, const char* error_buffer, const std::string& url) {
    if (code == CURLE_HTTP_RETURNED_ERROR) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        return ObjError(code_for_status(status), url, "HTTP status " + std::to_string(status));
    }
    std::string detail = (error_buffer && error_buffer[0] != '\0') ? error_buffer : curl_easy_strerror(code);
    return ObjError(ErrorCode::NetworkError, url, "HTTP transfer failed: " + detail);
}

// Streaming GET driven through the multi interface.
// Body bytes are buffered only as far as one curl_multi_perform call delivers them.
class HttpByteSource : public ByteSource {
public:
    HttpByteSource(const HttpConfig& config, std::string url, uint64_t offset)
        : url_(std::move(url))
        , offset_(offset) {
        error_buffer_[0] = '\0';
        apply_common_options(easy_.get(), config, url_, error_buffer_);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEFUNCTION, body_callback);
        curl_easy_setopt(easy_.get(), CURLOPT_WRITEDATA, &pending_);
        curl_easy_setopt(easy_.get(), CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(easy_.get(), CURLOPT_HEADERDATA, &headers_);
        if (offset_ > 0) {
            std::string range = std::to_string(offset_) + "-";
            curl_easy_setopt(easy_.get(), CURLOPT_RANGE, range.c_str());
        }

        CURLMcode mc = curl_multi_add_handle(multi_.get(), easy_.get());
        if (mc != CURLM_OK) {
            throw ObjError(ErrorCode::NetworkError, url_,
                std::string("Failed to start transfer: ") + curl_multi_strerror(mc));
        }
    }

    ~HttpByteSource() override {
        close();
    }

    // Drive the transfer until the response headers are in.
    // Throws the mapped HTTP/transport error if the request fails first.
    ObjectInfo start() {
        for (;;) {
            perform();
            if (done_ || headers_.complete) break;
            wait();
        }

        if (done_ && !succeeded()) {
            long status = 0;
            curl_easy_getinfo(easy_.get(), CURLINFO_RESPONSE_CODE, &status);
            if (result_ == CURLE_HTTP_RETURNED_ERROR && status == 416) {
                // Offset at or past the end of the object
                OBJIO_LOG_VERBOSE("[http] " << url_ << " has no bytes at offset " << offset_);
                empty_ = true;
                return info_from_headers(headers_, offset_);
            }
            throw failure();
        }

        if (offset_ > 0 && headers_.status != 206) {
            // Server ignored Range and sends the whole object: skip up to offset ourselves
            OBJIO_LOG_VERBOSE("[http] " << url_ << " ignored Range (status " << headers_.status
                              << "), skipping " << offset_ << " bytes");
            skip_ = offset_;
            return info_from_headers(headers_, 0);
        }
        return info_from_headers(headers_, offset_);
    }

    ReadResult read(std::byte* buf, size_t len) override {
        if (closed_) {
            throw ObjError(ErrorCode::NetworkError, url_, "Read on closed HTTP source");
        }
        if (empty_) {
            return ReadResult{0, true};
        }
        if (len == 0) {
            return ReadResult{0, false};
        }

        skip_pending();
        while (pending_pos_ >= pending_.size() && !done_) {
            perform();
            skip_pending();
            if (done_ || pending_pos_ < pending_.size()) break;
            wait();
        }

        size_t available = pending_.size() - pending_pos_;
        if (available == 0) {
            // Transfer finished and everything it delivered has been handed out
            if (!succeeded()) {
                throw failure();
            }
            return ReadResult{0, true};
        }

        size_t n = std::min(len, available);
        std::memcpy(buf, pending_.data() + pending_pos_, n);
        pending_pos_ += n;
        if (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
        }

        // A failed transfer reports its error on the next read, never with data
        bool eof = done_ && succeeded() && pending_.empty();
        return ReadResult{n, eof};
    }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        curl_multi_remove_handle(multi_.get(), easy_.get());
        pending_.clear();
        pending_pos_ = 0;
    }

private:
    bool succeeded() const {
        return result_ == CURLE_OK && multi_failure_.empty();
    }

    ObjError failure() {
        if (!multi_failure_.empty()) {
            return ObjError(ErrorCode::NetworkError, url_, multi_failure_);
        }
        return transfer_error(easy_.get(), result_, error_buffer_, url_);
    }

    // Drop buffered bytes that precede the requested offset
    void skip_pending() {
        size_t available = pending_.size() - pending_pos_;
        size_t n = static_cast<size_t>(std::min<uint64_t>(skip_, available));
        pending_pos_ += n;
        skip_ -= n;
        if (pending_pos_ == pending_.size()) {
            pending_.clear();
            pending_pos_ = 0;
        }
    }

    // Run whatever socket work is ready; sets done_ once the transfer is over
    void perform() {
        int running = 0;
        CURLMcode mc = curl_multi_perform(multi_.get(), &running);
        if (mc != CURLM_OK) {
            multi_failure_ = std::string("curl_multi_perform failed: ") + curl_multi_strerror(mc);
            done_ = true;
            return;
        }
        if (running == 0) {
            int queued = 0;
            CURLMsg* msg = nullptr;
            while ((msg = curl_multi_info_read(multi_.get(), &queued)) != nullptr) {
                if (msg->msg == CURLMSG_DONE) {
                    result_ = msg->data.result;
                }
            }
            done_ = true;
        }
    }

    // Block until the socket is ready or the timeout passes
    void wait() {
        int numfds = 0;
        CURLMcode mc = curl_multi_wait(multi_.get(), nullptr, 0, kWaitTimeoutMs, &numfds);
        if (mc != CURLM_OK) {
            multi_failure_ = std::string("curl_multi_wait failed: ") + curl_multi_strerror(mc);
            done_ = true;
        }
    }

    std::string url_;
    uint64_t offset_;
    CurlHandle easy_;
    CurlMultiHandle multi_;
    ResponseHeaders headers_;
    std::string pending_;
    size_t pending_pos_ = 0;
    uint64_t skip_ = 0;  // body bytes still to drop when Range was ignored
    bool done_ = false;
    bool empty_ = false;
    bool closed_ = false;
    CURLcode result_ = CURLE_OK;
    std::string multi_failure_;
    char error_buffer_[CURL_ERROR_SIZE];
};

} // anonymous namespace

HttpTransport::HttpTransport(HttpConfig config)
    : config_(std::move(config)) {
    if (config_.endpoint.empty()) {
        throw ObjError(ErrorCode::ConfigError, "HTTP transport requires an endpoint");
    }
}

std::string HttpTransport::name() const {
    return "http:" + config_.endpoint;
}

std::string HttpTransport::build_url(const ObjectId& id) const {
    std::string url = config_.endpoint;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    CurlHandle curl;
    auto append_segments = [&](const std::string& path) {
        size_t start = 0;
        while (start <= path.size()) {
            size_t end = path.find('/', start);
            if (end == std::string::npos) {
                end = path.size();
            }
            std::string segment = path.substr(start, end - start);
            if (!segment.empty()) {
                char* escaped = curl_easy_escape(curl.get(), segment.c_str(), static_cast<int>(segment.size()));
                if (!escaped) {
                    throw ObjError(ErrorCode::InvalidURI, id.to_string(), "Failed to escape object key");
                }
                url += "/";
                url += escaped;
                curl_free(escaped);
            }
            start = end + 1;
        }
    };
    append_segments(id.container);
    append_segments(id.key);
    return url;
}

FetchResult HttpTransport::fetch_range(const ObjectId& id, uint64_t offset) {
    std::string url = build_url(id);
    OBJIO_LOG_VERBOSE("[http] GET " << url << " from offset " << offset);

    auto source = std::make_unique<HttpByteSource>(config_, url, offset);
    FetchResult result;
    try {
        result.info = source->start();
    } catch (const ObjError& e) {
        OBJIO_LOG_WARN("[http] GET failed for " << url << ": " << e.what());
        throw;
    }
    result.source = std::move(source);
    return result;
}

ObjectInfo HttpTransport::fetch_metadata(const ObjectId& id) {
    std::string url = build_url(id);
    OBJIO_LOG_VERBOSE("[http] HEAD " << url);

    CurlHandle curl;
    ResponseHeaders headers;
    char error_buffer[CURL_ERROR_SIZE];
    error_buffer[0] = '\0';

    apply_common_options(curl.get(), config_, url, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &headers);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        ObjError error = transfer_error(curl.get(), res, error_buffer, url);
        OBJIO_LOG_WARN("[http] HEAD failed for " << url << ": " << error.what());
        throw error;
    }

    if (headers.get("content-length").empty()) {
        throw ObjError(ErrorCode::NetworkError, url, "HEAD response carries no Content-Length");
    }
    return info_from_headers(headers, 0);
}

} // namespace objio
