#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"

#include <cassert>
#include <string>
#include <vector>

int main() {
    using namespace chunkswarm;
    using directory::DirectoryRegistry;
    daemon::StructuredLogger::instance().set_enabled(false);

    DirectoryRegistry registry;
    const FileDescriptor file{"movie.mkv", std::string(40, 'e'), 3 * 1024 * 1024 + 10, 0};
    const PeerEndpoint seeder{"10.0.0.5", 6000};

    auto result = registry.register_peer(file, {seeder, {0, 1, 2, 3}});
    assert(!result.updated);
    assert(result.peers_count == 1);
    assert(result.message == "Peer registered successfully");

    // Same (hash, ip, port): the chunk set is replaced, not duplicated.
    result = registry.register_peer(file, {seeder, {0, 1}});
    assert(result.updated);
    assert(result.peers_count == 1);
    assert(result.message == "Peer updated successfully");

    result = registry.register_peer(file, {seeder, {0, 1}});
    assert(result.updated && result.peers_count == 1);

    result = registry.register_peer(file, {{"10.0.0.5", 6001}, {2, 3}});
    assert(!result.updated);
    assert(result.peers_count == 2);

    const auto lookup = registry.lookup_by_name("movie.mkv");
    assert(lookup.has_value());
    assert(lookup->file.content_hash == file.content_hash);
    assert(lookup->file.size == file.size);
    assert(lookup->file.chunk_count == 4);
    assert(lookup->peers.size() == 2);
    assert((lookup->peers[0].chunks == std::vector<ChunkIndex>{0, 1}));
    assert(lookup->peers[1].endpoint.port == 6001);

    assert(!registry.lookup_by_name("other.mkv").has_value());

    // A second file with the same name does not shadow the first.
    registry.register_peer({"movie.mkv", std::string(40, 'f'), 10, 0}, {seeder, {0}});
    assert(registry.lookup_by_name("movie.mkv")->file.content_hash == file.content_hash);

    const auto files = registry.list_files();
    assert(files.size() == 2);
    assert(files[0].peers_count == 2);
    assert(files[1].peers_count == 1);
    assert(registry.file_count() == 2);

    directory::LocalDirectory local(registry);
    assert(local.lookup("movie.mkv").has_value());
    assert(local.list_files().size() == 2);

    return 0;
}
