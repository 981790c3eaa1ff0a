#include "chunkswarm/core/AvailabilityIndex.hpp"

#include <algorithm>

namespace chunkswarm {

AvailabilityMap build_availability(const std::vector<PeerAdvertisement>& peers, std::uint32_t chunk_count) {
    AvailabilityMap map{};
    map.candidates.resize(chunk_count);

    for (const auto& peer : peers) {
        for (const auto chunk : peer.chunks) {
            if (chunk >= chunk_count) {
                ++map.dropped_advertisements;
                continue;
            }
            auto& slot = map.candidates[chunk];
            if (std::find(slot.begin(), slot.end(), peer.endpoint) == slot.end()) {
                slot.push_back(peer.endpoint);
            }
        }
    }

    return map;
}

}  // namespace chunkswarm
