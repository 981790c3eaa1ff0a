#include "chunkswarm/Errors.hpp"
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
#include <vector>

using namespace std::chrono_literals;

namespace {

template <typename Fn>
bool throws_planning_error(Fn&& fn) {
    try {
        fn();
    } catch (const chunkswarm::PlanningError& ex) {
        return ex.kind() == chunkswarm::ErrorKind::Planning;
    }
    return false;
}

}  // namespace

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    test::TempDir dir("missing");
    const std::uint64_t size = 2 * kChunkSize + 100;
    const auto data = test::make_pattern(static_cast<std::size_t>(size), 31);
    const auto source = dir.path() / "notes.txt";
    test::write_file(source, data);
    const auto descriptor = describe_file(source);
    assert(descriptor.chunk_count == 3);

    server::HostedFileTable table;
    assert(table.add(descriptor.content_hash, source));
    Config server_config{};
    server::ChunkServer server(table, server_config);
    server.start("127.0.0.1", 0);
    const PeerEndpoint live{"127.0.0.1", server.listening_port()};
    const PeerEndpoint dead{"127.0.0.1", test::unused_port()};

    directory::DirectoryRegistry registry;
    directory::LocalDirectory local(registry);

    Config config{};
    config.download_directory = (dir.path() / "downloads").string();
    config.fetch_socket_timeout = 2s;
    config.planner_seed = 3;
    DownloadOrchestrator orchestrator(local, config);

    // Chunk 2 is advertised by nobody; chunk 1 only by a peer that is gone.
    directory::LookupResult lookup{};
    lookup.file = descriptor;
    lookup.peers = {{live, {0}}, {dead, {1}}};
    const auto outcome = orchestrator.run(lookup);

    assert(outcome.status == DownloadStatus::Incomplete);
    assert((outcome.missing_chunks == std::vector<ChunkIndex>{1, 2}));
    assert(outcome.primary_failures == 1);
    assert(outcome.retry_recoveries == 0);
    assert(outcome.bytes_written == 0);
    assert(!std::filesystem::exists(dir.path() / "downloads" / descriptor.content_hash));

    // Planning failures surface before any transfer.
    assert(throws_planning_error([&]() {
        directory::LookupResult empty{};
        empty.file = descriptor;
        static_cast<void>(orchestrator.run(empty));
    }));
    assert(throws_planning_error([&]() {
        directory::LookupResult no_hash = lookup;
        no_hash.file.content_hash.clear();
        static_cast<void>(orchestrator.run(no_hash));
    }));
    assert(throws_planning_error([&]() {
        directory::LookupResult bad_hash = lookup;
        bad_hash.file.content_hash = "not-a-hash";
        static_cast<void>(orchestrator.run(bad_hash));
    }));
    assert(throws_planning_error([&]() { static_cast<void>(orchestrator.download("unknown.txt")); }));

    server.stop();
    return 0;
}
