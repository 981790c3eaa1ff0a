#include "chunkswarm/core/ChunkBuffer.hpp"

#include <cassert>
#include <thread>
#include <vector>

int main() {
    using namespace chunkswarm;

    ChunkBuffer buffer(3);
    assert(buffer.chunk_count() == 3);
    assert(!buffer.complete());
    assert((buffer.missing() == std::vector<ChunkIndex>{0, 1, 2}));

    assert(buffer.fill(1, ChunkData{1, 2, 3}));
    assert(buffer.has(1));
    assert(!buffer.has(0));
    // The first delivery for a chunk stays.
    assert(!buffer.fill(1, ChunkData{9}));
    assert((*buffer.slot(1) == ChunkData{1, 2, 3}));
    assert(!buffer.fill(3, ChunkData{7}));
    assert(!buffer.has(3));
    assert(buffer.filled() == 1);
    assert((buffer.missing() == std::vector<ChunkIndex>{0, 2}));

    ChunkBuffer empty(0);
    assert(empty.complete());
    assert(empty.missing().empty());

    // Racing writers: exactly one wins each slot.
    ChunkBuffer shared(64);
    std::vector<std::thread> writers;
    std::vector<int> wins(4, 0);
    for (int writer = 0; writer < 4; ++writer) {
        writers.emplace_back([&shared, &wins, writer]() {
            for (ChunkIndex chunk = 0; chunk < 64; ++chunk) {
                if (shared.fill(chunk, ChunkData(8, static_cast<std::uint8_t>(writer)))) {
                    ++wins[writer];
                }
            }
        });
    }
    for (auto& thread : writers) {
        thread.join();
    }
    assert(shared.complete());
    assert(wins[0] + wins[1] + wins[2] + wins[3] == 64);
    return 0;
}
