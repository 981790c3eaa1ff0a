#pragma once

#include "chunkswarm/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace chunkswarm {

struct AvailabilityMap {
    // candidates[chunk] lists the peers advertising that chunk, in directory order.
    std::vector<std::vector<PeerEndpoint>> candidates;
    std::size_t dropped_advertisements{0};

    [[nodiscard]] std::uint32_t chunk_count() const noexcept {
        return static_cast<std::uint32_t>(candidates.size());
    }
};

// Advertised ids outside [0, chunk_count) are dropped and counted. A peer listed twice
// for the same chunk appears once.
AvailabilityMap build_availability(const std::vector<PeerAdvertisement>& peers, std::uint32_t chunk_count);

}  // namespace chunkswarm
