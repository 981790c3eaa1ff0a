#pragma once

#include "chunkswarm/Types.hpp"

#include <chrono>
#include <string>

namespace chunkswarm::network {

enum class FetchStatus {
    Ok,
    ConnectFailed,
    Timeout,
    ShortRead,
    FramingError,
    PeerRejected
};

const char* fetch_status_to_string(FetchStatus status) noexcept;

struct FetchResult {
    FetchStatus status{FetchStatus::ConnectFailed};
    ChunkIndex chunk{0};
    ChunkData data;
    // Error text returned by the peer, or a short description of the failure.
    std::string detail;

    [[nodiscard]] bool ok() const noexcept { return status == FetchStatus::Ok; }
};

// One connection, one GET_CHUNK request, one framed response. Every socket operation
// is bounded by timeout. Failures are reported in the result, never thrown.
FetchResult fetch_chunk(const PeerEndpoint& peer,
                        const std::string& content_hash,
                        ChunkIndex chunk,
                        std::chrono::milliseconds timeout);

}  // namespace chunkswarm::network
