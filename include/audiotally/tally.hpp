#pragma once

#include <string>
#include <vector>

#include "audiotally/aggregate.hpp"
#include "audiotally/config.hpp"
#include "audiotally/pool.hpp"

namespace audiotally {

// ─── Tally Result ───────────────────────────────────────────────────────────

struct PathFailure {
    std::string path;
    FileError error;
};

struct TallyResult {
    StatisticsRecord stats;
    DurationTable durations;                 // discovery order
    std::vector<PathFailure> failures;       // discovery order
    std::vector<std::string> mp3_early_stops;
    int num_workers = 0;
};

/// Resolve the duration of every path concurrently and aggregate.
///
/// Wires the jobs/results channels, the worker pool and the aggregator:
/// jobs are queued synchronously and the channel closed before any result is
/// awaited. `progress` fires once per file.
///
///   auto files = audiotally::collect_audio_files(dir).files;
///   auto r = audiotally::tally_files(files);
///   std::cout << audiotally::format_report(r.stats);
///
TallyResult tally_files(const std::vector<std::string> &paths,
                        const TallyConfig &config = make_default_config(),
                        ProgressFn progress = {},
                        Resolver resolver = resolve_duration);

} // namespace audiotally
