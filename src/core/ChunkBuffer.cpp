#include "chunkswarm/core/ChunkBuffer.hpp"

#include <utility>

namespace chunkswarm {

ChunkBuffer::ChunkBuffer(std::uint32_t chunk_count)
    : slots_(chunk_count) {}

bool ChunkBuffer::fill(ChunkIndex chunk, ChunkData data) {
    std::scoped_lock lock(mutex_);
    if (chunk >= slots_.size() || slots_[chunk].has_value()) {
        return false;
    }
    slots_[chunk] = std::move(data);
    ++filled_;
    return true;
}

bool ChunkBuffer::has(ChunkIndex chunk) const {
    std::scoped_lock lock(mutex_);
    return chunk < slots_.size() && slots_[chunk].has_value();
}

bool ChunkBuffer::complete() const {
    std::scoped_lock lock(mutex_);
    return filled_ == slots_.size();
}

std::vector<ChunkIndex> ChunkBuffer::missing() const {
    std::scoped_lock lock(mutex_);
    std::vector<ChunkIndex> result;
    for (std::size_t index = 0; index < slots_.size(); ++index) {
        if (!slots_[index].has_value()) {
            result.push_back(static_cast<ChunkIndex>(index));
        }
    }
    return result;
}

std::size_t ChunkBuffer::filled() const {
    std::scoped_lock lock(mutex_);
    return filled_;
}

}  // namespace chunkswarm
