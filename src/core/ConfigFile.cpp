#include "chunkswarm/ConfigFile.hpp"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>
#include <vector>

namespace chunkswarm::config {

namespace {

using Path = std::vector<std::string>;

std::string join_path(const Path& path) {
    std::string combined;
    for (std::size_t i = 0; i < path.size(); ++i) {
        combined += path[i];
        if (i + 1 < path.size()) {
            combined += '.';
        }
    }
    return combined;
}

const json::Value* find_path(const json::Value& root, const Path& path) {
    const json::Value* node = &root;
    for (const auto& key : path) {
        node = node->find(key);
        if (node == nullptr) {
            return nullptr;
        }
    }
    return node;
}

std::optional<std::string> get_string(const json::Value& root, const Path& path) {
    const auto* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const json::Value& root, const Path& path) {
    const auto* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_bool()) {
        return node->bool_value;
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const json::Value& root, const Path& path) {
    const auto* node = find_path(root, path);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_number() && std::floor(node->number_value) == node->number_value
        && std::fabs(node->number_value) < 9.0e15) {
        return static_cast<std::int64_t>(node->number_value);
    }
    throw ConfigError("E_CONFIG_TYPE", "Expected integer at config path " + join_path(path));
}

template <typename T>
std::optional<T> get_ranged(const json::Value& root, const Path& path, std::int64_t min, std::int64_t max) {
    const auto value = get_int64(root, path);
    if (!value) {
        return std::nullopt;
    }
    if (*value < min || *value > max) {
        throw ConfigError("E_CONFIG_VALUE",
                          join_path(path) + " must be between " + std::to_string(min) + " and " + std::to_string(max));
    }
    return static_cast<T>(*value);
}

}  // namespace

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    if (!code.empty()) {
        formatted = "[" + code + "] " + message;
    } else {
        formatted = message;
    }
}

void apply_config(const json::Value& root, Config& config) {
    if (!root.is_object()) {
        throw ConfigError("E_CONFIG_STRUCTURE", "Configuration root must be an object");
    }

    if (auto host = get_string(root, {"peer", "listen_host"})) {
        config.listen_host = *host;
    }
    if (auto port = get_ranged<std::uint16_t>(root, {"peer", "listen_port"}, 0, 65535)) {
        config.listen_port = *port;
    }
    if (auto advertise = get_string(root, {"peer", "advertise_host"})) {
        config.advertise_host = *advertise;
    }
    if (auto directory = get_string(root, {"peer", "download_directory"})) {
        if (directory->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "peer.download_directory must not be empty");
        }
        config.download_directory = *directory;
    }
    if (auto cache = get_bool(root, {"peer", "share_cache"})) {
        config.share_cache_enabled = *cache;
    }

    if (auto parallel = get_ranged<std::uint16_t>(root, {"fetch", "max_parallel_requests"}, 1, 256)) {
        config.fetch_max_parallel_requests = *parallel;
    }
    if (auto timeout = get_ranged<std::int64_t>(root, {"fetch", "socket_timeout_ms"}, 1, 3'600'000)) {
        config.fetch_socket_timeout = std::chrono::milliseconds(*timeout);
    }

    if (auto workers = get_ranged<std::uint16_t>(root, {"server", "worker_threads"}, 1, 1024)) {
        config.server_worker_threads = *workers;
    }
    if (auto pending = get_ranged<std::size_t>(root, {"server", "max_pending_connections"}, 1, 65536)) {
        config.server_max_pending_connections = *pending;
    }
    if (auto timeout = get_ranged<std::int64_t>(root, {"server", "socket_timeout_ms"}, 1, 3'600'000)) {
        config.server_socket_timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto request = get_ranged<std::size_t>(root, {"server", "max_request_bytes"}, 64, 65536)) {
        config.server_max_request_bytes = *request;
    }

    if (auto url = get_string(root, {"directory", "url"})) {
        if (url->empty()) {
            throw ConfigError("E_CONFIG_VALUE", "directory.url must not be empty");
        }
        config.tracker_url = *url;
    }
    if (auto timeout = get_ranged<std::int64_t>(root, {"directory", "timeout_seconds"}, 1, 300)) {
        config.tracker_timeout = std::chrono::seconds(*timeout);
    }
    if (auto host = get_string(root, {"directory", "listen_host"})) {
        config.directory_listen_host = *host;
    }
    if (auto port = get_ranged<std::uint16_t>(root, {"directory", "listen_port"}, 0, 65535)) {
        config.directory_listen_port = *port;
    }
    if (auto workers = get_ranged<std::uint16_t>(root, {"directory", "worker_threads"}, 1, 1024)) {
        config.directory_worker_threads = *workers;
    }
    if (auto body = get_ranged<std::size_t>(root,
                                          {"directory", "max_body_bytes"},
                                          1024,
                                          static_cast<std::int64_t>(kMaxRegistrationBodyBytes))) {
        config.directory_max_body_bytes = *body;
    }

    if (auto seed = get_ranged<std::uint32_t>(root, {"planner", "seed"}, 0, std::numeric_limits<std::uint32_t>::max())) {
        config.planner_seed = *seed;
    }
}

void load_config_file(const std::filesystem::path& path, Config& config) {
    const auto absolute = std::filesystem::absolute(path);
    std::ifstream input(absolute);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND", "Configuration file not found: " + absolute.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();

    json::Value document;
    try {
        document = json::parse(buffer.str());
    } catch (const json::ParseError& ex) {
        throw ConfigError("E_CONFIG_PARSE", std::string(ex.what()) + " in " + absolute.string());
    }
    apply_config(document, config);
}

void apply_environment(Config& config) {
    const char* url = std::getenv(kTrackerUrlEnvironment);
    if (url != nullptr && *url != '\0') {
        config.tracker_url = url;
    }
}

}  // namespace chunkswarm::config
