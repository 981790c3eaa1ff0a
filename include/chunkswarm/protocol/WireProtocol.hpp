#pragma once

#include "chunkswarm/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace chunkswarm::protocol {

inline constexpr std::string_view kGetChunkCommand = "GET_CHUNK";
inline constexpr std::string_view kErrorPrefix = "ERROR: ";
inline constexpr std::size_t kLengthPrefixSize = 4;

inline constexpr std::string_view kReasonInvalidRequest = "Invalid request";
inline constexpr std::string_view kReasonUnknownCommand = "Unknown command";
inline constexpr std::string_view kReasonFileNotFound = "File not found";
inline constexpr std::string_view kReasonInvalidChunkId = "Invalid chunk id";
inline constexpr std::string_view kReasonChunkOutOfRange = "Chunk out of range";
inline constexpr std::string_view kReasonServerError = "Server error";
inline constexpr std::string_view kReasonServerBusy = "Server busy";

enum class RequestError {
    Malformed,
    UnknownCommand,
    InvalidChunkId
};

struct ChunkRequest {
    std::string content_hash;
    ChunkIndex chunk{0};
};

struct RequestParseResult {
    bool success{false};
    ChunkRequest request;
    RequestError error{RequestError::Malformed};
};

// "GET_CHUNK <hash> <chunk>\n", sent in a single write.
std::string encode_request(const std::string& content_hash, ChunkIndex chunk);

// Accepts the line with or without its terminator; surrounding whitespace is ignored.
RequestParseResult parse_request(std::string_view line);

std::string_view request_error_reason(RequestError error) noexcept;

std::string encode_error(std::string_view reason);

std::array<std::uint8_t, kLengthPrefixSize> encode_length_prefix(std::uint32_t length) noexcept;
std::uint32_t decode_length_prefix(const std::uint8_t* data) noexcept;

}  // namespace chunkswarm::protocol
