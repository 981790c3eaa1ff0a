#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/Types.hpp"
#include "chunkswarm/core/AvailabilityIndex.hpp"

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace chunkswarm {

struct DownloadPlan {
    std::vector<DownloadTask> tasks;
    std::vector<ChunkIndex> unresolved;
    std::vector<std::string> diagnostics;
};

// Assigns every chunk to one peer drawn uniformly from its candidates. Over many
// chunks this spreads load across the swarm without tracking per-peer state.
class DownloadPlanner {
public:
    explicit DownloadPlanner(const Config& config);

    // Chunks beyond the map's range, or with no candidates, end up in unresolved.
    DownloadPlan plan(const AvailabilityMap& availability, std::uint32_t chunk_count);

private:
    std::mt19937 rng_;
};

}  // namespace chunkswarm
