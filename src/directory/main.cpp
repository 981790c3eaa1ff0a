#include "chunkswarm/Config.hpp"
#include "chunkswarm/ConfigFile.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/DirectoryRegistry.hpp"
#include "chunkswarm/directory/DirectoryServer.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace {

using chunkswarm::Config;
using chunkswarm::directory::DirectoryRegistry;
using chunkswarm::directory::DirectoryServer;

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_signal(int) {
    g_stop_requested = 1;
}

void install_signal_handlers() {
#ifdef SIGPIPE
    std::signal(SIGPIPE, SIG_IGN);
#endif
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

struct CliConfig {
    std::optional<std::string> listen_host;
    std::optional<std::uint16_t> listen_port;
    std::optional<std::string> config_path;
    bool quiet{false};
    bool show_help{false};
    bool valid{true};
    std::string error;
};

std::optional<std::pair<std::string, std::uint16_t>> parse_listen_endpoint(const std::string& text) {
    const auto pos = text.rfind(':');
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    std::string host = text.substr(0, pos);
    std::string port_text = text.substr(pos + 1);
    if (host.empty() || port_text.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    const auto port_value = std::strtoul(port_text.c_str(), &end, 10);
    if (!end || *end != '\0' || port_value > 65535) {
        return std::nullopt;
    }
    return std::make_pair(host, static_cast<std::uint16_t>(port_value));
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            parsed.quiet = true;
            continue;
        }
        if (arg == "--listen" || arg == "--config") {
            if (i + 1 >= argc) {
                parsed.valid = false;
                parsed.error = arg + " requires a value";
                break;
            }
            const std::string value = argv[++i];
            if (arg == "--config") {
                parsed.config_path = value;
                continue;
            }
            auto endpoint = parse_listen_endpoint(value);
            if (!endpoint) {
                parsed.valid = false;
                parsed.error = "Invalid --listen value";
                break;
            }
            parsed.listen_host = endpoint->first;
            parsed.listen_port = endpoint->second;
            continue;
        }
        parsed.valid = false;
        parsed.error = "Unknown argument: " + arg;
        break;
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [--listen host:port] [--config file]\n";
    std::cout << "Options:\n";
    std::cout << "  --listen host:port   Address to bind (default 0.0.0.0:5000)\n";
    std::cout << "  --config file        JSON configuration file\n";
    std::cout << "  -q, --quiet          Disable structured logging\n";
    std::cout << "  -h, --help           Show this message\n";
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.valid) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return EXIT_SUCCESS;
    }
    if (cli.quiet) {
        chunkswarm::daemon::StructuredLogger::instance().set_enabled(false);
    }

    Config config{};
    if (cli.config_path) {
        try {
            chunkswarm::config::load_config_file(*cli.config_path, config);
        } catch (const chunkswarm::config::ConfigError& ex) {
            std::cerr << ex.what() << "\n";
            if (!ex.hint.empty()) {
                std::cerr << "Hint: " << ex.hint << "\n";
            }
            return EXIT_FAILURE;
        }
    }
    if (cli.listen_host) {
        config.directory_listen_host = *cli.listen_host;
        config.directory_listen_port = *cli.listen_port;
    }

    install_signal_handlers();

    DirectoryRegistry registry;
    DirectoryServer server(registry, config);
    try {
        server.start(config.directory_listen_host, config.directory_listen_port);
    } catch (const std::exception& ex) {
        std::cerr << "Unable to start directory: " << ex.what() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "Directory listening on " << config.directory_listen_host << ':' << server.listening_port() << "\n";
    std::cout << "  POST /register, GET /lookup?file_name=<name>, GET /get_file/<name>, GET /files\n";

    while (g_stop_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    server.stop();
    std::cout << "Directory stopped with " << registry.file_count() << " registered files\n";
    return EXIT_SUCCESS;
}
