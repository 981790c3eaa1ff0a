#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/DownloadOrchestrator.hpp"
#include "chunkswarm/core/DownloadPlanner.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "chunkswarm/server/ChunkServer.hpp"
#include "chunkswarm/server/HostedFileTable.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <numeric>
#include <optional>
#include <vector>

using namespace std::chrono_literals;

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    test::TempDir dir("retry");
    const std::uint64_t size = 6 * kChunkSize;
    const auto data = test::make_pattern(static_cast<std::size_t>(size), 51);
    const auto source = dir.path() / "dataset.csv";
    test::write_file(source, data);
    const auto descriptor = describe_file(source);

    server::HostedFileTable full;
    assert(full.add(descriptor.content_hash, source));
    server::HostedFileTable empty;

    server::ChunkServer good_server(full, Config{});
    server::ChunkServer stale_server(empty, Config{});
    good_server.start("127.0.0.1", 0);
    stale_server.start("127.0.0.1", 0);
    const PeerEndpoint good{"127.0.0.1", good_server.listening_port()};
    const PeerEndpoint stale{"127.0.0.1", stale_server.listening_port()};

    // Both claim every chunk; the stale one answers "File not found".
    std::vector<ChunkIndex> chunks(descriptor.chunk_count);
    std::iota(chunks.begin(), chunks.end(), ChunkIndex{0});
    directory::LookupResult lookup{};
    lookup.file = descriptor;
    lookup.peers = {{stale, chunks}, {good, chunks}};

    // Pick a seed whose plan sends some, but not all, chunks to the stale peer.
    const auto availability = build_availability(lookup.peers, descriptor.chunk_count);
    std::optional<std::uint32_t> chosen_seed;
    std::size_t expected_failures = 0;
    for (std::uint32_t seed = 1; seed < 200 && !chosen_seed; ++seed) {
        Config probe{};
        probe.planner_seed = seed;
        DownloadPlanner planner(probe);
        const auto plan = planner.plan(availability, descriptor.chunk_count);
        std::size_t on_stale = 0;
        for (const auto& task : plan.tasks) {
            on_stale += task.peer == stale ? 1 : 0;
        }
        if (on_stale > 0 && on_stale < plan.tasks.size()) {
            chosen_seed = seed;
            expected_failures = on_stale;
        }
    }
    assert(chosen_seed.has_value());

    directory::DirectoryRegistry registry;
    directory::LocalDirectory local(registry);
    Config config{};
    config.download_directory = (dir.path() / "downloads").string();
    config.fetch_socket_timeout = 5s;
    config.fetch_max_parallel_requests = 3;
    config.planner_seed = *chosen_seed;
    DownloadOrchestrator orchestrator(local, config);

    std::size_t retried = 0;
    orchestrator.set_progress_callback([&retried](const DownloadProgress& progress) {
        retried += progress.from_retry ? 1 : 0;
    });
    const auto outcome = orchestrator.run(lookup);

    assert(outcome.status == DownloadStatus::Complete);
    assert(outcome.primary_failures == expected_failures);
    assert(outcome.retry_recoveries == expected_failures);
    assert(retried == expected_failures);
    assert(test::read_file(outcome.output_path) == data);
    assert(stale_server.statistics().requests_rejected >= expected_failures);

    good_server.stop();
    stale_server.stop();
    return 0;
}
