#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/DownloadOrchestrator.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "chunkswarm/server/ChunkServer.hpp"
#include "chunkswarm/server/HostedFileTable.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>

using namespace std::chrono_literals;

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    test::TempDir dir("corrupt");
    const std::uint64_t size = kChunkSize + kChunkSize / 4;
    const auto original = test::make_pattern(static_cast<std::size_t>(size), 41);
    const auto original_path = dir.path() / "original.bin";
    test::write_file(original_path, original);
    const auto descriptor = describe_file(original_path);

    // The peer serves a copy with one flipped byte under the original's hash.
    auto tampered = original;
    tampered[kChunkSize + 17] ^= 0xFFu;
    const auto tampered_path = dir.path() / "tampered.bin";
    test::write_file(tampered_path, tampered);

    server::HostedFileTable table;
    assert(table.add(descriptor.content_hash, tampered_path));
    server::ChunkServer server(table, Config{});
    server.start("127.0.0.1", 0);

    directory::DirectoryRegistry registry;
    registry.register_peer(descriptor, {{"127.0.0.1", server.listening_port()}, {0, 1}});
    directory::LocalDirectory local(registry);

    Config config{};
    config.download_directory = (dir.path() / "downloads").string();
    config.fetch_socket_timeout = 5s;
    DownloadOrchestrator orchestrator(local, config);
    const auto outcome = orchestrator.download("original.bin");

    assert(outcome.status == DownloadStatus::CorruptDiscarded);
    assert(outcome.missing_chunks.empty());
    assert(outcome.bytes_written == size);
    assert(outcome.actual_hash == hash_file(tampered_path));
    assert(outcome.actual_hash != descriptor.content_hash);
    assert(!std::filesystem::exists(outcome.output_path));
    assert(!std::filesystem::exists(dir.path() / "downloads" / descriptor.content_hash));

    server.stop();
    return 0;
}
