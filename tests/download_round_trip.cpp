#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/DownloadPlanner.hpp"
#include "chunkswarm/core/Peer.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <vector>

using namespace std::chrono_literals;

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    test::TempDir dir("round_trip");
    const std::uint64_t size = 3 * kChunkSize + kChunkSize / 2;
    const auto data = test::make_pattern(static_cast<std::size_t>(size), 21);
    const auto source = dir.path() / "archive.tar";
    test::write_file(source, data);

    directory::DirectoryRegistry registry;
    directory::LocalDirectory local(registry);

    Config seed_config{};
    seed_config.listen_host = "127.0.0.1";
    seed_config.listen_port = 0;
    seed_config.download_directory = (dir.path() / "seed_cache").string();
    Peer seeder(seed_config, local);
    seeder.start_serving();
    const auto shared = seeder.share(source);
    assert(shared.file.chunk_count == 4);
    assert(shared.advertised.ip == "127.0.0.1");
    assert(shared.advertised.port != 0);
    assert(!shared.cached_copy.has_value());
    assert(shared.registration.peers_count == 1);

    // The single peer is the only candidate, so all four tasks land on it.
    const auto lookup = local.lookup("archive.tar");
    assert(lookup.has_value());
    const auto availability = build_availability(lookup->peers, lookup->file.chunk_count);
    Config planner_config{};
    planner_config.planner_seed = 5;
    DownloadPlanner planner(planner_config);
    const auto plan = planner.plan(availability, lookup->file.chunk_count);
    assert(plan.tasks.size() == 4);
    for (const auto& task : plan.tasks) {
        assert(task.peer == shared.advertised);
    }

    Config leech_config{};
    leech_config.download_directory = (dir.path() / "downloads").string();
    leech_config.fetch_socket_timeout = 5s;
    leech_config.planner_seed = 5;
    Peer leecher(leech_config, local);

    std::vector<DownloadProgress> updates;
    const auto outcome = leecher.download("archive.tar", [&updates](const DownloadProgress& progress) {
        updates.push_back(progress);
    });

    assert(outcome.status == DownloadStatus::Complete);
    assert(outcome.output_path == dir.path() / "downloads" / shared.file.content_hash);
    assert(outcome.bytes_written == size);
    assert(outcome.actual_hash == shared.file.content_hash);
    assert(outcome.missing_chunks.empty());
    assert(outcome.primary_failures == 0);
    assert(test::read_file(outcome.output_path) == data);

    assert(updates.size() == 4);
    assert(updates.back().chunks_filled == 4);
    assert(updates.back().chunk_count == 4);

    // With the cache on, sharing copies the file into the download directory once.
    Config cache_config = seed_config;
    cache_config.share_cache_enabled = true;
    Peer caching(cache_config, local);
    const auto cached = caching.share(source);
    assert(cached.cached_copy.has_value());
    assert(test::read_file(*cached.cached_copy) == data);
    assert(registry.lookup_by_name("archive.tar")->peers.size() == 2);

    seeder.stop_serving();
    return 0;
}
