#include "test_helpers.hpp"

using namespace objio;

namespace {

HttpTransport make_transport(const LoopbackHttpServer& server) {
    HttpConfig config;
    config.endpoint = server.endpoint();
    config.connect_timeout_ms = 2000;
    return HttpTransport(config);
}

} // anonymous namespace

// ============================================================================
// Streaming GET Tests
// ============================================================================

void test_http_streams_whole_object() {
    std::cout << "  test_http_streams_whole_object..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/digits", "0123456789");
    HttpTransport http = make_transport(server);

    LazySeekableStream stream(http, ObjectId{"bucket", "digits"});
    ASSERT_EQ(server.requests().size(), 0u);
    ASSERT_EQ(read_to_end(stream, 4), "0123456789");
    ASSERT_FALSE(stream.has_active_fetch());

    ASSERT_TRUE(stream.info().has_value());
    ASSERT_EQ(stream.info()->size, 10u);
    ASSERT_EQ(stream.info()->content_type, "application/octet-stream");
    ASSERT_EQ(stream.info()->etag, "v1-10");

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].method, "GET");
    ASSERT_EQ(requests[0].path, "/bucket/digits");
    ASSERT_TRUE(requests[0].range.empty());

    std::cout << "    PASSED" << std::endl;
}

void test_http_seek_sends_range() {
    std::cout << "  test_http_seek_sends_range..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/digits", "0123456789");
    HttpTransport http = make_transport(server);

    LazySeekableStream stream(http, ObjectId{"bucket", "digits"});
    stream.seek(5, Whence::Start);
    ASSERT_EQ(read_to_end(stream), "56789");
    ASSERT_EQ(stream.position(), 10u);

    // Size comes from Content-Range, not from the partial Content-Length
    ASSERT_EQ(stream.info()->size, 10u);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].range, "bytes=5-");

    std::cout << "    PASSED" << std::endl;
}

void test_http_range_ignored_by_server() {
    std::cout << "  test_http_range_ignored_by_server..." << std::endl;

    LoopbackHttpServer server;
    server.honor_range = false;
    server.put("/bucket/digits", "0123456789");
    HttpTransport http = make_transport(server);

    // Full 200 body: the leading bytes are dropped and the size is the whole object
    FetchResult fetched = http.fetch_range(ObjectId{"bucket", "digits"}, 5);
    ASSERT_EQ(fetched.info.size, 10u);
    ASSERT_EQ(read_to_end(*fetched.source, 3), "56789");
    fetched.source->close();

    LazySeekableStream stream(http, ObjectId{"bucket", "digits"});
    stream.seek(7, Whence::Start);
    ASSERT_EQ(read_to_end(stream), "789");

    // Offset past the end of a full body is an empty read
    stream.seek(50, Whence::Start);
    ReadResult r;
    ASSERT_EQ(read_chunk(stream, 8, &r), "");
    ASSERT_TRUE(r.eof);

    ASSERT_EQ(server.requests().back().range, "bytes=50-");

    std::cout << "    PASSED" << std::endl;
}

void test_http_offset_at_or_past_end() {
    std::cout << "  test_http_offset_at_or_past_end..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/digits", "0123456789");
    HttpTransport http = make_transport(server);

    // 416 becomes an empty source, not an error
    FetchResult fetched = http.fetch_range(ObjectId{"bucket", "digits"}, 10);
    ReadResult r;
    ASSERT_EQ(read_chunk(*fetched.source, 8, &r), "");
    ASSERT_TRUE(r.eof);
    fetched.source->close();

    LazySeekableStream stream(http, ObjectId{"bucket", "digits"});
    stream.seek(50, Whence::Start);
    ASSERT_EQ(read_chunk(stream, 8, &r), "");
    ASSERT_TRUE(r.eof);
    ASSERT_EQ(stream.position(), 50u);

    ASSERT_EQ(server.requests().back().range, "bytes=50-");

    std::cout << "    PASSED" << std::endl;
}

void test_http_large_object_in_chunks() {
    std::cout << "  test_http_large_object_in_chunks..." << std::endl;

    LoopbackHttpServer server;
    std::string data = make_content(20000);
    server.put("/bucket/large.bin", data);
    HttpTransport http = make_transport(server);

    LazySeekableStream stream(http, ObjectId{"bucket", "large.bin"});
    stream.seek(12345, Whence::Start);
    ASSERT_EQ(read_chunk(stream, 100), data.substr(12345, 100));
    ASSERT_TRUE(stream.has_active_fetch());
    ASSERT_EQ(read_to_end(stream, 777), data.substr(12445));
    ASSERT_EQ(stream.info()->size, 20000u);

    // One GET served every chunk
    ASSERT_EQ(server.requests().size(), 1u);

    std::cout << "    PASSED" << std::endl;
}

// ============================================================================
// Status Mapping Tests
// ============================================================================

void test_http_status_mapping() {
    std::cout << "  test_http_status_mapping..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/present", "data");
    server.fail("/bucket/unauthorized", 401);
    server.fail("/bucket/forbidden", 403);
    server.fail("/bucket/broken", 500);
    HttpTransport http = make_transport(server);

    ASSERT_THROWS_CODE(http.fetch_range(ObjectId{"bucket", "missing"}, 0), ErrorCode::NotFound);
    ASSERT_THROWS_CODE(http.fetch_metadata(ObjectId{"bucket", "missing"}), ErrorCode::NotFound);
    ASSERT_THROWS_CODE(http.fetch_range(ObjectId{"bucket", "unauthorized"}, 0), ErrorCode::AccessDenied);
    ASSERT_THROWS_CODE(http.fetch_metadata(ObjectId{"bucket", "forbidden"}), ErrorCode::AccessDenied);
    ASSERT_THROWS_CODE(http.fetch_range(ObjectId{"bucket", "forbidden"}, 3), ErrorCode::AccessDenied);
    ASSERT_THROWS_CODE(http.fetch_range(ObjectId{"bucket", "broken"}, 0), ErrorCode::NetworkError);
    ASSERT_THROWS_CODE(http.fetch_metadata(ObjectId{"bucket", "broken"}), ErrorCode::NetworkError);

    // A failed fetch leaves the stream where it was
    LazySeekableStream stream(http, ObjectId{"bucket", "missing"});
    stream.seek(2, Whence::Start);
    std::byte buf[4];
    ASSERT_THROWS_CODE(stream.read(buf, sizeof(buf)), ErrorCode::NotFound);
    ASSERT_EQ(stream.position(), 2u);
    ASSERT_FALSE(stream.has_active_fetch());

    std::cout << "    PASSED" << std::endl;
}

// ============================================================================
// Metadata Tests
// ============================================================================

void test_http_metadata_uses_head() {
    std::cout << "  test_http_metadata_uses_head..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/dir/blob", make_content(4321));
    HttpTransport http = make_transport(server);

    LazySeekableStream stream(http, ObjectId{"bucket", "dir/blob"});
    ASSERT_EQ(stream.size(), 4321u);
    ASSERT_EQ(stream.info()->content_type, "application/octet-stream");
    ASSERT_EQ(stream.info()->etag, "v1-4321");
    ASSERT_FALSE(stream.has_active_fetch());
    ASSERT_EQ(stream.position(), 0u);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    ASSERT_EQ(requests[0].method, "HEAD");
    ASSERT_EQ(requests[0].path, "/bucket/dir/blob");

    std::cout << "    PASSED" << std::endl;
}

void test_http_basic_auth() {
    std::cout << "  test_http_basic_auth..." << std::endl;

    LoopbackHttpServer server;
    server.put("/bucket/secret", "s3cr3t");

    HttpConfig config;
    config.endpoint = server.endpoint();
    config.username = "user";
    config.password = "pass";
    HttpTransport http(config);

    ASSERT_EQ(http.fetch_metadata(ObjectId{"bucket", "secret"}).size, 6u);
    LazySeekableStream stream(http, ObjectId{"bucket", "secret"});
    ASSERT_EQ(read_to_end(stream), "s3cr3t");

    for (const auto& request : server.requests()) {
        ASSERT_EQ(request.authorization, "Basic dXNlcjpwYXNz");
    }

    std::cout << "    PASSED" << std::endl;
}

// ============================================================================
// ObjectStore over HTTP Tests
// ============================================================================

void test_http_store_download() {
    std::cout << "  test_http_store_download..." << std::endl;

    LoopbackHttpServer server;
    std::string data = make_content(3000);
    server.put("/bucket/model.bin", data);

    Sandbox sandbox("http_store");
    StoreOptions options;
    options.base_dir = sandbox.path();
    ObjectStore store(options);

    HttpConfig config;
    config.endpoint = server.endpoint();
    store.add_transport("remote", std::make_unique<HttpTransport>(config));

    ASSERT_EQ(store.stat("@remote:bucket/model.bin").size, 3000u);

    auto temp = store.download("@remote:bucket/model.bin");
    ASSERT_EQ(temp->size(), 3000u);
    ASSERT_EQ(read_to_end(*temp, 512), data);

    fs::path target = sandbox.path() / "tail.bin";
    ASSERT_EQ(store.download_to("@remote:bucket/model.bin", target, 2900), 100u);
    ASSERT_EQ(sandbox.read("tail.bin"), data.substr(2900));

    std::cout << "    PASSED" << std::endl;
}

// ============================================================================
// Test runners
// ============================================================================

void run_streaming_tests() {
    std::cout << "\n=== HTTP Streaming Tests ===" << std::endl;
    test_http_streams_whole_object();
    test_http_seek_sends_range();
    test_http_range_ignored_by_server();
    test_http_offset_at_or_past_end();
    test_http_large_object_in_chunks();
}

void run_status_tests() {
    std::cout << "\n=== HTTP Status Tests ===" << std::endl;
    test_http_status_mapping();
    test_http_metadata_uses_head();
    test_http_basic_auth();
}

void run_store_tests() {
    std::cout << "\n=== HTTP ObjectStore Tests ===" << std::endl;
    test_http_store_download();
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "HttpTransport Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    // Loopback requests must not go through a configured proxy
    setenv("no_proxy", "127.0.0.1,localhost", 1);
    setenv("NO_PROXY", "127.0.0.1,localhost", 1);

    try {
        run_streaming_tests();
        run_status_tests();
        run_store_tests();

        std::cout << "\n========================================" << std::endl;
        std::cout << "All tests PASSED!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\nTest failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
