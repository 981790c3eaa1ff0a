#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>

namespace chunkswarm {

struct ChunkRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};
};

std::uint32_t chunk_count(std::uint64_t file_size) noexcept;

// Byte range of a chunk inside a file of file_size bytes. Throws std::out_of_range
// for chunk ids outside [0, chunk_count(file_size)).
ChunkRange chunk_range(ChunkIndex chunk, std::uint64_t file_size);

std::string hash_bytes(std::span<const std::uint8_t> data);

// Streams the file in kChunkSize reads; throws std::runtime_error when it cannot be read.
std::string hash_file(const std::filesystem::path& path);

FileDescriptor describe_file(const std::filesystem::path& path);

}  // namespace chunkswarm
