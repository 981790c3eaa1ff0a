#pragma once

#include "chunkswarm/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace chunkswarm {

// One slot per chunk of a download. The first successful write to a slot wins;
// later deliveries for the same chunk are discarded.
class ChunkBuffer {
public:
    explicit ChunkBuffer(std::uint32_t chunk_count);

    // Returns true when data was stored, false for an occupied or out-of-range slot.
    bool fill(ChunkIndex chunk, ChunkData data);

    [[nodiscard]] bool has(ChunkIndex chunk) const;
    [[nodiscard]] bool complete() const;
    [[nodiscard]] std::vector<ChunkIndex> missing() const;
    [[nodiscard]] std::size_t filled() const;
    [[nodiscard]] std::uint32_t chunk_count() const noexcept { return static_cast<std::uint32_t>(slots_.size()); }

    // Only valid once no writer remains.
    [[nodiscard]] const std::optional<ChunkData>& slot(ChunkIndex chunk) const { return slots_.at(chunk); }

private:
    std::vector<std::optional<ChunkData>> slots_;
    std::size_t filled_{0};
    mutable std::mutex mutex_;
};

}  // namespace chunkswarm
