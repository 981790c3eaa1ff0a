#include "chunkswarm/protocol/WireProtocol.hpp"

#include <cctype>
#include <charconv>
#include <system_error>
#include <vector>

namespace chunkswarm::protocol {

namespace {

std::vector<std::string_view> split_whitespace(std::string_view text) {
    std::vector<std::string_view> tokens;
    std::size_t cursor = 0;
    while (cursor < text.size()) {
        while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) != 0) {
            ++cursor;
        }
        const auto start = cursor;
        while (cursor < text.size() && std::isspace(static_cast<unsigned char>(text[cursor])) == 0) {
            ++cursor;
        }
        if (cursor > start) {
            tokens.push_back(text.substr(start, cursor - start));
        }
    }
    return tokens;
}

bool parse_chunk_index(std::string_view text, ChunkIndex& value) {
    if (text.empty()) {
        return false;
    }
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

}  // namespace

std::string encode_request(const std::string& content_hash, ChunkIndex chunk) {
    std::string line(kGetChunkCommand);
    line.push_back(' ');
    line.append(content_hash);
    line.push_back(' ');
    line.append(std::to_string(chunk));
    line.push_back('\n');
    return line;
}

RequestParseResult parse_request(std::string_view line) {
    RequestParseResult result;
    const auto tokens = split_whitespace(line);
    if (tokens.size() != 3) {
        result.error = RequestError::Malformed;
        return result;
    }
    if (tokens[0] != kGetChunkCommand) {
        result.error = RequestError::UnknownCommand;
        return result;
    }
    ChunkIndex chunk = 0;
    if (!parse_chunk_index(tokens[2], chunk)) {
        result.error = RequestError::InvalidChunkId;
        return result;
    }
    result.success = true;
    result.request.content_hash = std::string(tokens[1]);
    result.request.chunk = chunk;
    return result;
}

std::string_view request_error_reason(RequestError error) noexcept {
    switch (error) {
        case RequestError::Malformed:
            return kReasonInvalidRequest;
        case RequestError::UnknownCommand:
            return kReasonUnknownCommand;
        case RequestError::InvalidChunkId:
            return kReasonInvalidChunkId;
    }
    return kReasonInvalidRequest;
}

std::string encode_error(std::string_view reason) {
    std::string message(kErrorPrefix);
    message.append(reason);
    return message;
}

std::array<std::uint8_t, kLengthPrefixSize> encode_length_prefix(std::uint32_t length) noexcept {
    return {static_cast<std::uint8_t>((length >> 24) & 0xFFu),
            static_cast<std::uint8_t>((length >> 16) & 0xFFu),
            static_cast<std::uint8_t>((length >> 8) & 0xFFu),
            static_cast<std::uint8_t>(length & 0xFFu)};
}

std::uint32_t decode_length_prefix(const std::uint8_t* data) noexcept {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

}  // namespace chunkswarm::protocol
