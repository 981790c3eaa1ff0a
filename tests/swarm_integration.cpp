#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/Peer.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "chunkswarm/directory/DirectoryServer.hpp"
#include "chunkswarm/directory/HttpDirectoryClient.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <set>
#include <string>
#include <thread>

using namespace std::chrono_literals;

int main() {
    using namespace chunkswarm;
    daemon::StructuredLogger::instance().set_enabled(false);

    test::TempDir dir("swarm");
    const std::uint64_t size = 5 * kChunkSize + 12345;
    const auto data = test::make_pattern(static_cast<std::size_t>(size), 61);

    // Two seeders hold identical copies under different paths.
    const auto first_copy = dir.path() / "a" / "movie.mkv";
    const auto second_copy = dir.path() / "b" / "movie.mkv";
    std::filesystem::create_directories(first_copy.parent_path());
    std::filesystem::create_directories(second_copy.parent_path());
    test::write_file(first_copy, data);
    test::write_file(second_copy, data);

    directory::DirectoryRegistry registry;
    directory::DirectoryServer tracker(registry, Config{});
    tracker.start("127.0.0.1", 0);
    const auto tracker_url = "http://127.0.0.1:" + std::to_string(tracker.listening_port());

    auto seeder_config = [&](const std::string& label) {
        Config config{};
        config.listen_host = "127.0.0.1";
        config.listen_port = 0;
        config.tracker_url = tracker_url;
        config.download_directory = (dir.path() / label).string();
        return config;
    };

    directory::HttpDirectoryClient first_client(tracker_url);
    directory::HttpDirectoryClient second_client(tracker_url);
    Peer first(seeder_config("first_cache"), first_client);
    Peer second(seeder_config("second_cache"), second_client);
    first.start_serving();
    second.start_serving();
    const auto first_share = first.share(first_copy);
    const auto second_share = second.share(second_copy);
    assert(first_share.file.content_hash == second_share.file.content_hash);
    assert(first_share.registration.peers_count == 1);
    assert(second_share.registration.peers_count == 2);
    assert(registry.file_count() == 1);

    Config leech_config{};
    leech_config.tracker_url = tracker_url;
    leech_config.download_directory = (dir.path() / "downloads").string();
    leech_config.fetch_socket_timeout = 5s;
    leech_config.fetch_max_parallel_requests = 4;
    leech_config.planner_seed = 11;
    directory::HttpDirectoryClient leech_client(tracker_url);
    Peer leecher(leech_config, leech_client);

    std::set<std::uint16_t> sources;
    const auto outcome = leecher.download("movie.mkv", [&sources](const DownloadProgress& progress) {
        sources.insert(progress.peer.port);
    });

    assert(outcome.status == DownloadStatus::Complete);
    assert(outcome.descriptor.chunk_count == 6);
    assert(outcome.primary_failures == 0);
    assert(test::read_file(outcome.output_path) == data);
    assert(!sources.empty());

    // Every chunk was fetched exactly once across the two seeders.
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    auto served = [&]() {
        return first.server_statistics().chunks_served + second.server_statistics().chunks_served;
    };
    while (served() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    assert(served() == 6);

    first.stop_serving();
    second.stop_serving();
    tracker.stop();
    return 0;
}
