#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "chunkswarm/directory/DirectoryServer.hpp"
#include "chunkswarm/directory/HttpDirectoryClient.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <cstdio>
#include <numeric>
#include <string>
#include <vector>

namespace {

bool has_status(const std::string& reply, const std::string& status_line) {
    return reply.rfind(status_line, 0) == 0;
}

bool body_contains(const std::string& reply, const std::string& text) {
    const auto split = reply.find("\r\n\r\n");
    return split != std::string::npos && reply.find(text, split) != std::string::npos;
}

std::string hex_size(std::size_t size) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%zx", size);
    return buffer;
}

}  // namespace

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    directory::DirectoryRegistry registry;
    Config config{};
    config.directory_worker_threads = 2;
    directory::DirectoryServer server(registry, config);
    server.start("127.0.0.1", 0);
    assert(server.running());
    const auto port = server.listening_port();

    directory::HttpDirectoryClient client("http://127.0.0.1:" + std::to_string(port), std::chrono::seconds(5));

    FileDescriptor file{};
    file.name = "report final.pdf";
    file.content_hash = "a9993e364706816aba3e25717850c26c9cd0d89d";
    file.size = 2 * 1024 * 1024 + 5;
    file.chunk_count = 3;

    const auto first = client.register_peer(file, {{"10.0.0.1", 7001}, {0, 1, 2}});
    assert(!first.updated);
    assert(first.peers_count == 1);
    assert(first.message == "Peer registered successfully");

    const auto second = client.register_peer(file, {{"10.0.0.2", 7002}, {1}});
    assert(!second.updated);
    assert(second.peers_count == 2);

    const auto again = client.register_peer(file, {{"10.0.0.1", 7001}, {2}});
    assert(again.updated);
    assert(again.peers_count == 2);
    assert(again.message == "Peer updated successfully");

    // The space in the name has to survive query escaping.
    const auto lookup = client.lookup("report final.pdf");
    assert(lookup.has_value());
    assert(lookup->file.content_hash == file.content_hash);
    assert(lookup->file.size == file.size);
    assert(lookup->file.chunk_count == 3);
    assert(lookup->peers.size() == 2);
    for (const auto& peer : lookup->peers) {
        if (peer.endpoint.ip == "10.0.0.1") {
            assert(peer.endpoint.port == 7001);
            assert((peer.chunks == std::vector<ChunkIndex>{2}));
        } else {
            assert(peer.endpoint.ip == "10.0.0.2");
            assert((peer.chunks == std::vector<ChunkIndex>{1}));
        }
    }

    assert(!client.lookup("missing.bin").has_value());

    const auto files = client.list_files();
    assert(files.size() == 1);
    assert(files.front().file.name == "report final.pdf");
    assert(files.front().peers_count == 2);

    // Raw requests for the error paths.
    const auto missing_param = test::raw_exchange(port, "GET /lookup HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(has_status(missing_param, "HTTP/1.1 400"));
    assert(body_contains(missing_param, "Missing file_name parameter"));

    const std::string partial = R"({"file_name":"a.bin","file_size":10,"ip":"10.0.0.3","port":7003,"chunks":[0]})";
    const auto missing_field = test::raw_exchange(
        port,
        "POST /register HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\nContent-Length: "
            + std::to_string(partial.size()) + "\r\n\r\n" + partial);
    assert(has_status(missing_field, "HTTP/1.1 400"));
    assert(body_contains(missing_field, "file_hash"));

    const auto not_json = test::raw_exchange(
        port, "POST /register HTTP/1.1\r\nHost: x\r\nContent-Length: 5\r\n\r\nhello");
    assert(has_status(not_json, "HTTP/1.1 400"));

    const auto unknown = test::raw_exchange(port, "GET /nowhere HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(has_status(unknown, "HTTP/1.1 404"));

    const auto wrong_method = test::raw_exchange(port, "GET /register HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(has_status(wrong_method, "HTTP/1.1 405"));

    const auto unknown_file = test::raw_exchange(port, "GET /lookup?file_name=nothing.bin HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(has_status(unknown_file, "HTTP/1.1 404"));
    assert(body_contains(unknown_file, "File not found"));

    const auto by_path = test::raw_exchange(port, "GET /get_file/report%20final.pdf HTTP/1.1\r\nHost: x\r\n\r\n");
    assert(has_status(by_path, "HTTP/1.1 200"));
    assert(body_contains(by_path, file.content_hash));

    // Chunked request bodies are reassembled before the JSON is parsed.
    const std::string chunked_body =
        R"({"file_name":"chunked.bin","file_hash":"da39a3ee5e6b4b0d3255bfef95601890afd80709",)"
        R"("file_size":10,"ip":"10.0.0.9","port":7009,"chunks":[0]})";
    const auto split = chunked_body.size() / 3;
    const auto chunked = test::raw_exchange(
        port,
        "POST /register HTTP/1.1\r\nHost: x\r\nContent-Type: application/json\r\nTransfer-Encoding: chunked\r\n\r\n"
            + hex_size(split) + "\r\n" + chunked_body.substr(0, split) + "\r\n"
            + hex_size(chunked_body.size() - split) + ";note=rest\r\n" + chunked_body.substr(split) + "\r\n"
            + "0\r\nX-Trailer: done\r\n\r\n");
    assert(has_status(chunked, "HTTP/1.1 200"));
    assert(body_contains(chunked, "Peer registered successfully"));
    const auto chunked_lookup = client.lookup("chunked.bin");
    assert(chunked_lookup.has_value());
    assert(chunked_lookup->file.size == 10);
    assert(chunked_lookup->peers.size() == 1);
    assert(chunked_lookup->peers.front().endpoint.port == 7009);

    // A client waiting for 100 Continue gets it before the final reply.
    const auto continued = test::raw_exchange(
        port,
        "POST /register HTTP/1.1\r\nHost: x\r\nExpect: 100-continue\r\nContent-Length: "
            + std::to_string(chunked_body.size()) + "\r\n\r\n" + chunked_body);
    assert(has_status(continued, "HTTP/1.1 100 Continue\r\n\r\n"));
    assert(continued.find("HTTP/1.1 200", 1) != std::string::npos);
    assert(continued.find("Peer updated successfully") != std::string::npos);

    const auto gzip = test::raw_exchange(
        port, "POST /register HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: gzip\r\n\r\n");
    assert(has_status(gzip, "HTTP/1.1 501"));

    // Advertising every chunk of a 200 GiB file fits within the default body limit.
    assert(Config{}.directory_max_body_bytes == kMaxRegistrationBodyBytes);
    assert(max_registration_body_bytes() > 4294967295ull * 10ull);
    FileDescriptor huge{};
    huge.name = "archive-200g.tar";
    huge.content_hash = "356a192b7913b04c54574d18c28d46e6395428ab";
    huge.size = 200ull * 1024ull * kChunkSize;
    huge.chunk_count = chunk_count(huge.size);
    assert(huge.chunk_count == 204800);
    PeerAdvertisement everything{{"10.0.0.7", 7007}, std::vector<ChunkIndex>(huge.chunk_count)};
    std::iota(everything.chunks.begin(), everything.chunks.end(), ChunkIndex{0});
    const auto huge_result = client.register_peer(huge, everything);
    assert(huge_result.peers_count == 1);
    const auto huge_lookup = client.lookup("archive-200g.tar");
    assert(huge_lookup.has_value());
    assert(huge_lookup->file.chunk_count == 204800);
    assert(huge_lookup->peers.size() == 1);
    assert(huge_lookup->peers.front().chunks.size() == 204800);
    assert(huge_lookup->peers.front().chunks.back() == 204799);

    // A configured limit still applies to both framings.
    {
        directory::DirectoryRegistry small_registry;
        Config small{};
        small.directory_worker_threads = 1;
        small.directory_max_body_bytes = 1024;
        directory::DirectoryServer limited(small_registry, small);
        limited.start("127.0.0.1", 0);
        const auto limited_port = limited.listening_port();

        const auto by_length = test::raw_exchange(
            limited_port, "POST /register HTTP/1.1\r\nHost: x\r\nContent-Length: 4096\r\n\r\n");
        assert(has_status(by_length, "HTTP/1.1 413"));

        const auto by_chunks = test::raw_exchange(
            limited_port, "POST /register HTTP/1.1\r\nHost: x\r\nTransfer-Encoding: chunked\r\n\r\n800\r\n");
        assert(has_status(by_chunks, "HTTP/1.1 413"));
        assert(small_registry.file_count() == 0);
        limited.stop();
    }

    // A client pointed at a dead directory reports a transport error.
    directory::HttpDirectoryClient dead("http://127.0.0.1:" + std::to_string(test::unused_port()), std::chrono::seconds(2));
    bool threw = false;
    try {
        static_cast<void>(dead.list_files());
    } catch (const directory::DirectoryError& ex) {
        threw = ex.kind() == ErrorKind::Transport;
    }
    assert(threw);

    server.stop();
    assert(!server.running());
    return 0;
}
