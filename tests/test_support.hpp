#pragma once

#include "chunkswarm/Types.hpp"
#include "chunkswarm/network/SocketIo.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace chunkswarm::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& label) {
        std::random_device device;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path()
            / ("chunkswarm_" + label + "_" + std::to_string(stamp) + "_" + std::to_string(device()));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline ChunkData make_pattern(std::size_t size, std::uint32_t seed) {
    std::mt19937 rng(seed);
    ChunkData data(size);
    for (auto& byte : data) {
        byte = static_cast<std::uint8_t>(rng() & 0xFFu);
    }
    return data;
}

inline void write_file(const std::filesystem::path& path, const ChunkData& data) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline ChunkData read_file(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    return ChunkData((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
}

// Sends request on a fresh connection and returns every byte received until the peer closes.
inline std::string raw_exchange(std::uint16_t port, const std::string& request) {
    network::IoStatus status = network::IoStatus::Failed;
    network::ScopedSocket socket(network::connect_to({"127.0.0.1", port}, std::chrono::seconds(5), status));
    if (!socket.valid()) {
        return {};
    }
    static_cast<void>(network::set_socket_timeouts(socket.get(), std::chrono::seconds(5)));
    if (network::send_all(socket.get(), request) != network::IoStatus::Ok) {
        return {};
    }
    std::string reply;
    std::uint8_t buffer[4096];
    while (true) {
        std::size_t received = 0;
        if (network::recv_some(socket.get(), buffer, sizeof(buffer), received) != network::IoStatus::Ok || received == 0) {
            break;
        }
        reply.append(reinterpret_cast<const char*>(buffer), received);
    }
    return reply;
}

// A port that was free a moment ago; nothing listens on it.
inline std::uint16_t unused_port() {
    const auto listener = network::open_listener("127.0.0.1", 0, 1);
    const auto port = network::local_port(listener);
    network::close_socket(listener);
    return port;
}

}  // namespace chunkswarm::test
