#pragma once

#include "chunkswarm/Config.hpp"
#include "chunkswarm/json/Json.hpp"

#include <exception>
#include <filesystem>
#include <string>

namespace chunkswarm::config {

inline constexpr const char* kTrackerUrlEnvironment = "CHUNKSWARM_TRACKER_URL";

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

// Reads a JSON document of the form
//   {"peer": {...}, "fetch": {...}, "server": {...}, "directory": {...}, "planner": {...}}
// and overwrites the matching fields of config. Unknown keys are ignored.
void load_config_file(const std::filesystem::path& path, Config& config);
void apply_config(const json::Value& root, Config& config);

// CHUNKSWARM_TRACKER_URL replaces the tracker URL when set and non-empty.
void apply_environment(Config& config);

}  // namespace chunkswarm::config
