#include "chunkswarm/core/DownloadPlanner.hpp"

#include "chunkswarm/daemon/StructuredLogger.hpp"

#include <random>
#include <sstream>

namespace chunkswarm {

namespace {
std::mt19937::result_type seed_from_config(const Config& config) {
    if (config.planner_seed.has_value()) {
        return static_cast<std::mt19937::result_type>(*config.planner_seed);
    }
    std::random_device device;
    return static_cast<std::mt19937::result_type>(device());
}
}

DownloadPlanner::DownloadPlanner(const Config& config)
    : rng_(seed_from_config(config)) {}

DownloadPlan DownloadPlanner::plan(const AvailabilityMap& availability, std::uint32_t chunk_count) {
    DownloadPlan plan{};
    const auto total = chunk_count;
    plan.tasks.reserve(total);

    if (availability.dropped_advertisements > 0) {
        plan.diagnostics.emplace_back("Ignored out-of-range advertisements: "
                                      + std::to_string(availability.dropped_advertisements));
    }

    for (ChunkIndex chunk = 0; chunk < total; ++chunk) {
        if (chunk >= availability.chunk_count() || availability.candidates[chunk].empty()) {
            plan.unresolved.push_back(chunk);
            daemon::log_event(daemon::StructuredLogger::Level::Warning,
                              "download.plan.unresolved",
                              {{"chunk", std::to_string(chunk)}});
            continue;
        }

        const auto& candidates = availability.candidates[chunk];
        std::uniform_int_distribution<std::size_t> pick(0, candidates.size() - 1);
        plan.tasks.push_back(DownloadTask{candidates[pick(rng_)], chunk});
    }

    std::ostringstream oss;
    oss << "Planned " << plan.tasks.size() << " of " << total << " chunks";
    if (!plan.unresolved.empty()) {
        oss << ", " << plan.unresolved.size() << " without any advertising peer";
    }
    plan.diagnostics.push_back(oss.str());

    return plan;
}

}  // namespace chunkswarm
