#include "chunkswarm/core/DownloadOrchestrator.hpp"

#include "chunkswarm/Errors.hpp"
#include "chunkswarm/core/ChunkCodec.hpp"
#include "chunkswarm/core/WorkerPool.hpp"
#include "chunkswarm/daemon/StructuredLogger.hpp"
#include "chunkswarm/network/ChunkFetcher.hpp"

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace chunkswarm {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

// Fetch results in the order the workers finish them.
class CompletionQueue {
public:
    void push(network::FetchResult result) {
        {
            std::scoped_lock lock(mutex_);
            results_.push_back(std::move(result));
        }
        ready_.notify_one();
    }

    network::FetchResult pop() {
        std::unique_lock lock(mutex_);
        ready_.wait(lock, [this]() { return !results_.empty(); });
        auto result = std::move(results_.front());
        results_.pop_front();
        return result;
    }

private:
    std::deque<network::FetchResult> results_;
    std::mutex mutex_;
    std::condition_variable ready_;
};

void log_fetch_failure(const char* event, const PeerEndpoint& peer, const network::FetchResult& result) {
    log_event(StructuredLogger::Level::Warning,
              event,
              {{"peer", endpoint_to_string(peer)},
               {"chunk", std::to_string(result.chunk)},
               {"status", network::fetch_status_to_string(result.status)},
               {"detail", result.detail}});
}

}  // namespace

const char* download_status_to_string(DownloadStatus status) noexcept {
    switch (status) {
        case DownloadStatus::Complete:
            return "complete";
        case DownloadStatus::Incomplete:
            return "incomplete";
        case DownloadStatus::CorruptDiscarded:
            return "corrupt_discarded";
    }
    return "unknown";
}

DownloadOrchestrator::DownloadOrchestrator(directory::Directory& directory, Config config)
    : directory_(directory),
      config_(std::move(config)),
      planner_(config_) {}

void DownloadOrchestrator::set_progress_callback(ProgressCallback callback) {
    progress_ = std::move(callback);
}

DownloadOutcome DownloadOrchestrator::download(const std::string& file_name) {
    const auto lookup = directory_.lookup(file_name);
    if (!lookup.has_value()) {
        throw PlanningError("File not found in directory: " + file_name);
    }
    auto resolved = *lookup;
    if (resolved.file.name.empty()) {
        resolved.file.name = file_name;
    }
    return run(resolved);
}

DownloadOutcome DownloadOrchestrator::run(const directory::LookupResult& lookup) {
    if (lookup.peers.empty()) {
        throw PlanningError("Directory returned no peers for " + lookup.file.name);
    }
    if (lookup.file.content_hash.empty()) {
        throw PlanningError("Directory omitted the content hash for " + lookup.file.name);
    }
    if (!is_content_hash(lookup.file.content_hash)) {
        throw PlanningError("Directory returned a malformed content hash for " + lookup.file.name);
    }

    DownloadOutcome outcome{};
    outcome.descriptor = lookup.file;
    outcome.descriptor.content_hash = to_lower(lookup.file.content_hash);
    outcome.descriptor.chunk_count = chunk_count(lookup.file.size);
    const auto& file = outcome.descriptor;

    const auto availability = build_availability(lookup.peers, file.chunk_count);
    const auto plan = planner_.plan(availability, file.chunk_count);
    for (const auto& line : plan.diagnostics) {
        log_event(StructuredLogger::Level::Debug, "download.plan", {{"hash", file.content_hash}, {"detail", line}});
    }
    log_event(StructuredLogger::Level::Info,
              "download.started",
              {{"name", file.name},
               {"hash", file.content_hash},
               {"size", std::to_string(file.size)},
               {"chunks", std::to_string(file.chunk_count)},
               {"peers", std::to_string(lookup.peers.size())},
               {"tasks", std::to_string(plan.tasks.size())}});

    ChunkBuffer buffer(file.chunk_count);
    const auto failed = primary_pass(file, plan, buffer);
    outcome.primary_failures = failed.size();
    if (!failed.empty()) {
        outcome.retry_recoveries = retry_pass(file, plan, availability, failed, buffer);
    }

    if (!buffer.complete()) {
        outcome.status = DownloadStatus::Incomplete;
        outcome.missing_chunks = buffer.missing();
        log_event(StructuredLogger::Level::Error,
                  "download.incomplete",
                  {{"hash", file.content_hash},
                   {"missing", std::to_string(outcome.missing_chunks.size())},
                   {"chunks", std::to_string(file.chunk_count)}});
        return outcome;
    }

    assemble(buffer, outcome);
    return outcome;
}

std::vector<ChunkIndex> DownloadOrchestrator::primary_pass(const FileDescriptor& file,
                                                           const DownloadPlan& plan,
                                                           ChunkBuffer& buffer) {
    std::vector<ChunkIndex> failed;
    if (plan.tasks.empty()) {
        return failed;
    }

    const auto timeout = config_.fetch_socket_timeout;
    const auto threads = std::max<std::size_t>(1, config_.fetch_max_parallel_requests);
    CompletionQueue completions;
    std::vector<PeerEndpoint> assigned(file.chunk_count);

    WorkerPool pool(std::min(threads, plan.tasks.size()), 0, "fetch");
    for (const auto& task : plan.tasks) {
        assigned[task.chunk] = task.peer;
        const bool queued = pool.submit([&completions, task, hash = file.content_hash, timeout]() {
            try {
                completions.push(network::fetch_chunk(task.peer, hash, task.chunk, timeout));
            } catch (const std::exception& ex) {
                network::FetchResult result{};
                result.status = network::FetchStatus::ConnectFailed;
                result.chunk = task.chunk;
                result.detail = ex.what();
                completions.push(std::move(result));
            }
        });
        if (!queued) {
            network::FetchResult result{};
            result.chunk = task.chunk;
            result.detail = "fetch pool rejected the task";
            completions.push(std::move(result));
        }
    }

    for (std::size_t drained = 0; drained < plan.tasks.size(); ++drained) {
        auto result = completions.pop();
        const auto chunk = result.chunk;
        if (!result.ok()) {
            log_fetch_failure("download.fetch.failed", assigned[chunk], result);
            failed.push_back(chunk);
            continue;
        }
        if (buffer.fill(chunk, std::move(result.data))) {
            report(chunk, assigned[chunk], buffer, false);
        }
    }
    pool.shutdown();

    std::sort(failed.begin(), failed.end());
    return failed;
}

std::size_t DownloadOrchestrator::retry_pass(const FileDescriptor& file,
                                             const DownloadPlan& plan,
                                             const AvailabilityMap& availability,
                                             const std::vector<ChunkIndex>& failed,
                                             ChunkBuffer& buffer) {
    std::vector<PeerEndpoint> assigned(file.chunk_count);
    for (const auto& task : plan.tasks) {
        assigned[task.chunk] = task.peer;
    }

    std::size_t recovered = 0;
    for (const auto chunk : failed) {
        if (buffer.has(chunk)) {
            continue;
        }

        // Peers other than the one that just failed go first; it gets one more attempt last.
        std::vector<PeerEndpoint> order;
        for (const auto& candidate : availability.candidates[chunk]) {
            if (!(candidate == assigned[chunk])) {
                order.push_back(candidate);
            }
        }
        order.push_back(assigned[chunk]);

        for (const auto& peer : order) {
            auto result = network::fetch_chunk(peer, file.content_hash, chunk, config_.fetch_socket_timeout);
            if (!result.ok()) {
                log_fetch_failure("download.retry.failed", peer, result);
                continue;
            }
            if (buffer.fill(chunk, std::move(result.data))) {
                ++recovered;
                log_event(StructuredLogger::Level::Info,
                          "download.retry.recovered",
                          {{"peer", endpoint_to_string(peer)}, {"chunk", std::to_string(chunk)}});
                report(chunk, peer, buffer, true);
            }
            break;
        }
    }
    return recovered;
}

void DownloadOrchestrator::assemble(const ChunkBuffer& buffer, DownloadOutcome& outcome) {
    const auto& file = outcome.descriptor;
    const std::filesystem::path directory(config_.download_directory);
    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        throw std::runtime_error("Unable to create " + directory.string() + ": " + ec.message());
    }
    outcome.output_path = directory / file.content_hash;

    {
        std::ofstream output(outcome.output_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Unable to open " + outcome.output_path.string() + " for writing");
        }
        for (ChunkIndex chunk = 0; chunk < buffer.chunk_count(); ++chunk) {
            const auto& data = *buffer.slot(chunk);
            output.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            outcome.bytes_written += data.size();
        }
        output.flush();
        if (!output) {
            throw std::runtime_error("Write failed for " + outcome.output_path.string());
        }
    }

    outcome.actual_hash = hash_file(outcome.output_path);
    if (outcome.actual_hash == file.content_hash) {
        outcome.status = DownloadStatus::Complete;
        log_event(StructuredLogger::Level::Info,
                  "download.complete",
                  {{"hash", file.content_hash},
                   {"path", outcome.output_path.string()},
                   {"bytes", std::to_string(outcome.bytes_written)}});
        return;
    }

    outcome.status = DownloadStatus::CorruptDiscarded;
    std::filesystem::remove(outcome.output_path, ec);
    log_event(StructuredLogger::Level::Error,
              "download.integrity.failed",
              {{"expected", file.content_hash},
               {"actual", outcome.actual_hash},
               {"removed", ec ? "false" : "true"}});
    if (ec) {
        throw std::runtime_error("Unable to remove corrupt download " + outcome.output_path.string() + ": " + ec.message());
    }
}

void DownloadOrchestrator::report(ChunkIndex chunk, const PeerEndpoint& peer, const ChunkBuffer& buffer, bool from_retry) {
    if (!progress_) {
        return;
    }
    DownloadProgress progress{};
    progress.chunk = chunk;
    progress.peer = peer;
    progress.chunks_filled = buffer.filled();
    progress.chunk_count = buffer.chunk_count();
    progress.from_retry = from_retry;
    progress_(progress);
}

}  // namespace chunkswarm
