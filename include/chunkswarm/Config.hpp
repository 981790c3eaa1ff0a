#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

namespace chunkswarm {

// Shared by every peer and the directory service; chunk counts only agree when it matches.
inline constexpr std::uint64_t kChunkSize = 1024ull * 1024ull;

// Size of a registration body that lists every chunk id of a file with the largest
// representable chunk count, plus headroom for the remaining fields.
constexpr std::uint64_t max_registration_body_bytes() {
    constexpr std::uint64_t kLastChunk = std::numeric_limits<std::uint32_t>::max() - 1ull;
    std::uint64_t total = 64ull * 1024ull;
    std::uint64_t low = 0;
    std::uint64_t high = 9;
    for (std::uint64_t digits = 1; low <= kLastChunk; ++digits) {
        const auto last = high < kLastChunk ? high : kLastChunk;
        total += (last - low + 1) * (digits + 1);  // digits plus a separating comma
        low = high + 1;
        high = high * 10 + 9;
    }
    return total;
}

inline constexpr std::size_t kMaxRegistrationBodyBytes =
    max_registration_body_bytes() < std::numeric_limits<std::size_t>::max()
        ? static_cast<std::size_t>(max_registration_body_bytes())
        : std::numeric_limits<std::size_t>::max();

struct Config {
    std::string listen_host{"0.0.0.0"};
    std::uint16_t listen_port{6000};
    std::optional<std::string> advertise_host{};
    std::string tracker_url{"http://127.0.0.1:5000"};
    std::chrono::seconds tracker_timeout{std::chrono::seconds(5)};
    std::string download_directory{"downloads/p2p_share"};
    bool share_cache_enabled{false};

    std::uint16_t fetch_max_parallel_requests{10};
    std::chrono::milliseconds fetch_socket_timeout{std::chrono::seconds(10)};

    std::uint16_t server_worker_threads{16};
    std::size_t server_max_pending_connections{256};
    std::chrono::milliseconds server_socket_timeout{std::chrono::seconds(30)};
    std::size_t server_max_request_bytes{1024};

    std::optional<std::uint32_t> planner_seed{};

    std::string directory_listen_host{"0.0.0.0"};
    std::uint16_t directory_listen_port{5000};
    std::uint16_t directory_worker_threads{8};
    std::size_t directory_max_body_bytes{kMaxRegistrationBodyBytes};
};

}  // namespace chunkswarm
