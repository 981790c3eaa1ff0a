#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/Types.hpp"
#include "chunkswarm/core/AvailabilityIndex.hpp"
#include "chunkswarm/core/ChunkBuffer.hpp"
#include "chunkswarm/core/DownloadPlanner.hpp"
#include "chunkswarm/directory/Directory.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace chunkswarm {

enum class DownloadStatus {
    Complete,
    Incomplete,
    CorruptDiscarded
};

const char* download_status_to_string(DownloadStatus status) noexcept;

struct DownloadOutcome {
    DownloadStatus status{DownloadStatus::Incomplete};
    FileDescriptor descriptor;
    std::filesystem::path output_path;
    std::uint64_t bytes_written{0};
    std::vector<ChunkIndex> missing_chunks;
    std::string actual_hash;
    std::size_t primary_failures{0};
    std::size_t retry_recoveries{0};
};

struct DownloadProgress {
    ChunkIndex chunk{0};
    PeerEndpoint peer;
    std::size_t chunks_filled{0};
    std::uint32_t chunk_count{0};
    bool from_retry{false};
};

using ProgressCallback = std::function<void(const DownloadProgress&)>;

// Drives one download: plan, concurrent primary pass, sequential retry pass,
// then assembly into <download_directory>/<content_hash> and whole-file verification.
class DownloadOrchestrator {
public:
    DownloadOrchestrator(directory::Directory& directory, Config config);

    // The callback runs on the calling thread, once per filled chunk.
    void set_progress_callback(ProgressCallback callback);

    // Looks the name up and runs the download. Throws PlanningError when the name is
    // unknown or the directory has nothing usable for it.
    DownloadOutcome download(const std::string& file_name);
    DownloadOutcome run(const directory::LookupResult& lookup);

private:
    directory::Directory& directory_;
    Config config_;
    DownloadPlanner planner_;
    ProgressCallback progress_;

    std::vector<ChunkIndex> primary_pass(const FileDescriptor& file,
                                         const DownloadPlan& plan,
                                         ChunkBuffer& buffer);
    std::size_t retry_pass(const FileDescriptor& file,
                           const DownloadPlan& plan,
                           const AvailabilityMap& availability,
                           const std::vector<ChunkIndex>& failed,
                           ChunkBuffer& buffer);
    void assemble(const ChunkBuffer& buffer, DownloadOutcome& outcome);
    void report(ChunkIndex chunk, const PeerEndpoint& peer, const ChunkBuffer& buffer, bool from_retry);
};

}  // namespace chunkswarm
