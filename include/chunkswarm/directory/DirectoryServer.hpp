#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace chunkswarm::directory {

// HTTP/1.1 front end for a DirectoryRegistry. One request per connection.
class DirectoryServer {
public:
    DirectoryServer(DirectoryRegistry& registry, Config config);
    ~DirectoryServer();

    DirectoryServer(const DirectoryServer&) = delete;
    DirectoryServer& operator=(const DirectoryServer&) = delete;

    // Throws std::runtime_error when the address cannot be bound.
    void start(const std::string& host, std::uint16_t port);
    void stop();

    [[nodiscard]] bool running() const noexcept;
    [[nodiscard]] std::uint16_t listening_port() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace chunkswarm::directory
