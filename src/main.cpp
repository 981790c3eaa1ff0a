#include "chunkswarm/Config.hpp"
#include "chunkswarm/ConfigFile.hpp"
#include "chunkswarm/Errors.hpp"
#include "chunkswarm/core/DownloadOrchestrator.hpp"
#include "chunkswarm/core/Peer.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/directory/HttpDirectoryClient.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace {

using chunkswarm::Config;
using chunkswarm::DownloadOutcome;
using chunkswarm::DownloadStatus;
using chunkswarm::Peer;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitIncomplete = 2;
constexpr int kExitIntegrity = 3;
constexpr int kExitPlanning = 4;

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
    std::vector<std::string> share_paths;
    std::optional<std::string> download_name;
    std::optional<std::string> config_path;
    std::optional<std::string> listen_host;
    std::optional<std::uint16_t> listen_port;
    std::optional<std::string> advertise_host;
    std::optional<std::string> tracker_url;
    std::optional<std::string> output_dir;
    std::optional<std::uint16_t> parallel;
    std::optional<std::uint32_t> timeout_seconds;
    std::optional<std::uint32_t> seed;
    bool list_files{false};
    bool no_cache{false};
    bool quiet{false};
    bool show_help{false};
    bool valid{true};
    std::string error;
};

template <typename T>
std::optional<T> parse_number(const std::string& text, T min, T max) {
    std::uint64_t value = 0;
    const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
    if (result.ec != std::errc{} || result.ptr != text.data() + text.size() || value < min || value > max) {
        return std::nullopt;
    }
    return static_cast<T>(value);
}

CliConfig parse_arguments(int argc, char** argv) {
    CliConfig parsed;
    auto fail = [&parsed](std::string message) {
        parsed.valid = false;
        parsed.error = std::move(message);
    };

    for (int i = 1; i < argc && parsed.valid; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            parsed.show_help = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            parsed.quiet = true;
            continue;
        }
        if (arg == "--list") {
            parsed.list_files = true;
            continue;
        }
        if (arg == "--no-cache") {
            parsed.no_cache = true;
            continue;
        }

        if (i + 1 >= argc) {
            fail(arg.rfind("--", 0) == 0 ? arg + " requires a value" : "Unknown argument: " + arg);
            break;
        }
        const std::string value = argv[i + 1];
        if (arg == "--share") {
            parsed.share_paths.push_back(value);
        } else if (arg == "--download") {
            parsed.download_name = value;
        } else if (arg == "--config") {
            parsed.config_path = value;
        } else if (arg == "--host") {
            parsed.listen_host = value;
        } else if (arg == "--advertise") {
            parsed.advertise_host = value;
        } else if (arg == "--tracker") {
            parsed.tracker_url = value;
        } else if (arg == "--output-dir") {
            parsed.output_dir = value;
        } else if (arg == "--port") {
            parsed.listen_port = parse_number<std::uint16_t>(value, 0, 65535);
            if (!parsed.listen_port) {
                fail("Invalid --port value");
            }
        } else if (arg == "--parallel") {
            parsed.parallel = parse_number<std::uint16_t>(value, 1, 256);
            if (!parsed.parallel) {
                fail("--parallel must be between 1 and 256");
            }
        } else if (arg == "--timeout") {
            parsed.timeout_seconds = parse_number<std::uint32_t>(value, 1, 3600);
            if (!parsed.timeout_seconds) {
                fail("--timeout must be between 1 and 3600 seconds");
            }
        } else if (arg == "--seed") {
            parsed.seed = parse_number<std::uint32_t>(value, 0, std::numeric_limits<std::uint32_t>::max());
            if (!parsed.seed) {
                fail("Invalid --seed value");
            }
        } else {
            fail("Unknown argument: " + arg);
        }
        ++i;
    }

    if (parsed.valid && !parsed.show_help) {
        const int modes = (parsed.share_paths.empty() ? 0 : 1) + (parsed.download_name ? 1 : 0)
            + (parsed.list_files ? 1 : 0);
        if (modes == 0) {
            fail("Specify --share <path>, --download <name> or --list");
        } else if (modes > 1) {
            fail("--share, --download and --list cannot be combined");
        }
    }
    return parsed;
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --share <path> [--share <path> ...] [options]\n";
    std::cout << "       " << program << " --download <name> [options]\n";
    std::cout << "       " << program << " --list [--tracker URL]\n";
    std::cout << "Options:\n";
    std::cout << "  --port N             Chunk server port (default 6000, 0 picks one)\n";
    std::cout << "  --host ADDR          Chunk server bind address (default 0.0.0.0)\n";
    std::cout << "  --advertise ADDR     Address registered with the directory\n";
    std::cout << "  --tracker URL        Directory service URL (default http://127.0.0.1:5000)\n";
    std::cout << "  --output-dir DIR     Download directory (default downloads/p2p_share)\n";
    std::cout << "  --parallel N         Concurrent chunk transfers (default 10)\n";
    std::cout << "  --timeout SECONDS    Per-connection timeout (default 10)\n";
    std::cout << "  --seed N             Seed for peer selection\n";
    std::cout << "  --config FILE        JSON configuration file\n";
    std::cout << "  --list               List the files known to the directory\n";
    std::cout << "  --no-cache           Do not copy shared files into the download directory\n";
    std::cout << "  -q, --quiet          Disable structured logging\n";
    std::cout << "  -h, --help           Show this message\n";
    std::cout << "Environment:\n";
    std::cout << "  " << chunkswarm::config::kTrackerUrlEnvironment << "  Default directory service URL\n";
}

void apply_overrides(const CliConfig& cli, Config& config) {
    if (cli.listen_host) {
        config.listen_host = *cli.listen_host;
    }
    if (cli.listen_port) {
        config.listen_port = *cli.listen_port;
    }
    if (cli.advertise_host) {
        config.advertise_host = *cli.advertise_host;
    }
    if (cli.tracker_url) {
        config.tracker_url = *cli.tracker_url;
    }
    if (cli.output_dir) {
        config.download_directory = *cli.output_dir;
    }
    if (cli.parallel) {
        config.fetch_max_parallel_requests = *cli.parallel;
    }
    if (cli.timeout_seconds) {
        config.fetch_socket_timeout = std::chrono::seconds(*cli.timeout_seconds);
    }
    if (cli.seed) {
        config.planner_seed = *cli.seed;
    }
    if (cli.no_cache) {
        config.share_cache_enabled = false;
    }
}

int run_share(Peer& peer, const std::vector<std::string>& paths) {
    try {
        peer.start_serving();
    } catch (const std::exception& ex) {
        std::cerr << "Unable to start chunk server: " << ex.what() << "\n";
        return kExitUsage;
    }

    for (const auto& path : paths) {
        try {
            const auto shared = peer.share(path);
            std::cout << "Sharing " << shared.file.name << "\n"
                      << "  hash:   " << shared.file.content_hash << "\n"
                      << "  size:   " << shared.file.size << " bytes in " << shared.file.chunk_count << " chunks\n"
                      << "  peer:   " << chunkswarm::endpoint_to_string(shared.advertised) << "\n"
                      << "  status: " << shared.registration.message
                      << " (" << shared.registration.peers_count << " peers)\n";
        } catch (const chunkswarm::directory::DirectoryError& ex) {
            std::cerr << "Registration failed for " << path << ": " << ex.what() << "\n";
            peer.stop_serving();
            return kExitPlanning;
        } catch (const std::runtime_error& ex) {
            std::cerr << "Unable to share " << path << ": " << ex.what() << "\n";
            peer.stop_serving();
            return kExitUsage;
        }
    }

    std::cout << "Serving chunks; press Ctrl+C to stop.\n";
    while (g_stop_requested == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    peer.stop_serving();
    const auto stats = peer.server_statistics();
    std::cout << "Served " << stats.chunks_served << " chunks (" << stats.bytes_served << " bytes), "
              << stats.requests_rejected << " rejected requests\n";
    return kExitOk;
}

int report_outcome(const DownloadOutcome& outcome) {
    switch (outcome.status) {
        case DownloadStatus::Complete:
            std::cout << "Downloaded " << outcome.descriptor.name << " to " << outcome.output_path.string()
                      << " (" << outcome.bytes_written << " bytes, hash verified)\n";
            if (outcome.primary_failures > 0) {
                std::cout << "  " << outcome.primary_failures << " chunks failed on the first pass, "
                          << outcome.retry_recoveries << " recovered on retry\n";
            }
            return kExitOk;
        case DownloadStatus::Incomplete: {
            std::cerr << "Download incomplete: " << outcome.missing_chunks.size() << " of "
                      << outcome.descriptor.chunk_count << " chunks missing:";
            for (const auto chunk : outcome.missing_chunks) {
                std::cerr << ' ' << chunk;
            }
            std::cerr << "\n";
            return kExitIncomplete;
        }
        case DownloadStatus::CorruptDiscarded:
            std::cerr << "Integrity check failed: expected " << outcome.descriptor.content_hash << ", got "
                      << outcome.actual_hash << "; the file was discarded\n";
            return kExitIntegrity;
    }
    return kExitIncomplete;
}

int run_list(chunkswarm::directory::Directory& directory) {
    try {
        const auto files = directory.list_files();
        if (files.empty()) {
            std::cout << "The directory has no files\n";
        }
        for (const auto& summary : files) {
            std::cout << summary.file.name << "\n"
                      << "  hash:  " << summary.file.content_hash << "\n"
                      << "  size:  " << summary.file.size << " bytes in " << summary.file.chunk_count << " chunks\n"
                      << "  peers: " << summary.peers_count << "\n";
        }
        return kExitOk;
    } catch (const chunkswarm::directory::DirectoryError& ex) {
        std::cerr << "Directory unavailable: " << ex.what() << "\n";
    }
    return kExitPlanning;
}

int run_download(Peer& peer, const std::string& name, bool quiet) {
    chunkswarm::ProgressCallback progress;
    if (!quiet) {
        progress = [](const chunkswarm::DownloadProgress& update) {
            std::cout << "\r  chunks " << update.chunks_filled << '/' << update.chunk_count << std::flush;
            if (update.chunks_filled == update.chunk_count) {
                std::cout << "\n";
            }
        };
    }

    try {
        return report_outcome(peer.download(name, progress));
    } catch (const chunkswarm::PlanningError& ex) {
        std::cerr << "Download not possible: " << ex.what() << "\n";
    } catch (const chunkswarm::directory::DirectoryError& ex) {
        std::cerr << "Directory unavailable: " << ex.what() << "\n";
    }
    return kExitPlanning;
}

}  // namespace

int main(int argc, char** argv) {
    const auto cli = parse_arguments(argc, argv);
    if (!cli.valid) {
        std::cerr << cli.error << "\n";
        print_usage(argv[0]);
        return kExitUsage;
    }
    if (cli.show_help) {
        print_usage(argv[0]);
        return kExitOk;
    }
    if (cli.quiet) {
        chunkswarm::daemon::StructuredLogger::instance().set_enabled(false);
    }

    Config config{};
    config.share_cache_enabled = true;
    chunkswarm::config::apply_environment(config);
    if (cli.config_path) {
        try {
            chunkswarm::config::load_config_file(*cli.config_path, config);
        } catch (const chunkswarm::config::ConfigError& ex) {
            std::cerr << ex.what() << "\n";
            if (!ex.hint.empty()) {
                std::cerr << "Hint: " << ex.hint << "\n";
            }
            return kExitUsage;
        }
    }
    apply_overrides(cli, config);

    install_signal_handlers();

    chunkswarm::directory::HttpDirectoryClient directory(config.tracker_url, config.tracker_timeout);
    Peer peer(config, directory);

    try {
        if (cli.list_files) {
            return run_list(directory);
        }
        if (cli.download_name) {
            return run_download(peer, *cli.download_name, cli.quiet);
        }
        return run_share(peer, cli.share_paths);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal: " << ex.what() << "\n";
        return kExitUsage;
    }
}
