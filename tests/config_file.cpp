#include "chunkswarm/ConfigFile.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdlib>
#include <fstream>
#include <string>

namespace {

void write_text(const std::filesystem::path& path, const std::string& text) {
    std::ofstream output(path, std::ios::trunc);
    output << text;
}

bool load_fails_with(const std::filesystem::path& path, const std::string& code) {
    chunkswarm::Config config{};
    try {
        chunkswarm::config::load_config_file(path, config);
    } catch (const chunkswarm::config::ConfigError& ex) {
        return ex.code == code;
    }
    return false;
}

}  // namespace

int main() {
    using namespace chunkswarm;
    test::TempDir dir("config");

    const auto good = dir.path() / "peer.json";
    write_text(good, R"({
        "peer": {"listen_host": "127.0.0.1", "listen_port": 6100, "advertise_host": "192.168.1.20",
                 "download_directory": "/tmp/chunks", "share_cache": true},
        "fetch": {"max_parallel_requests": 4, "socket_timeout_ms": 2500},
        "server": {"worker_threads": 8, "max_pending_connections": 32, "socket_timeout_ms": 15000,
                   "max_request_bytes": 512},
        "directory": {"url": "http://tracker:5000", "timeout_seconds": 3, "listen_port": 5500},
        "planner": {"seed": 77},
        "unrelated": {"ignored": 1}
    })");

    Config config{};
    config::load_config_file(good, config);
    assert(config.listen_host == "127.0.0.1");
    assert(config.listen_port == 6100);
    assert(config.advertise_host == std::string("192.168.1.20"));
    assert(config.download_directory == "/tmp/chunks");
    assert(config.share_cache_enabled);
    assert(config.fetch_max_parallel_requests == 4);
    assert(config.fetch_socket_timeout == std::chrono::milliseconds(2500));
    assert(config.server_worker_threads == 8);
    assert(config.server_max_pending_connections == 32);
    assert(config.server_socket_timeout == std::chrono::milliseconds(15000));
    assert(config.server_max_request_bytes == 512);
    assert(config.tracker_url == "http://tracker:5000");
    assert(config.tracker_timeout == std::chrono::seconds(3));
    assert(config.directory_listen_port == 5500);
    assert(config.planner_seed == 77u);

    // Untouched fields keep their defaults.
    Config partial{};
    write_text(dir.path() / "partial.json", R"({"fetch": {"max_parallel_requests": 2}})");
    config::load_config_file(dir.path() / "partial.json", partial);
    assert(partial.fetch_max_parallel_requests == 2);
    assert(partial.listen_port == 6000);
    assert(partial.fetch_socket_timeout == std::chrono::seconds(10));

    write_text(dir.path() / "range.json", R"({"fetch": {"max_parallel_requests": 0}})");
    assert(load_fails_with(dir.path() / "range.json", "E_CONFIG_VALUE"));
    write_text(dir.path() / "type.json", R"({"peer": {"listen_port": "6000"}})");
    assert(load_fails_with(dir.path() / "type.json", "E_CONFIG_TYPE"));
    write_text(dir.path() / "broken.json", R"({"peer": )");
    assert(load_fails_with(dir.path() / "broken.json", "E_CONFIG_PARSE"));
    write_text(dir.path() / "array.json", "[1, 2]");
    assert(load_fails_with(dir.path() / "array.json", "E_CONFIG_STRUCTURE"));
    assert(load_fails_with(dir.path() / "absent.json", "E_CONFIG_NOT_FOUND"));

    ::setenv(config::kTrackerUrlEnvironment, "http://10.9.8.7:5000", 1);
    Config from_env{};
    config::apply_environment(from_env);
    assert(from_env.tracker_url == "http://10.9.8.7:5000");
    ::unsetenv(config::kTrackerUrlEnvironment);

    return 0;
}
