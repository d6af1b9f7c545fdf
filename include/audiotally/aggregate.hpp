#pragma once

#include <string>
#include <vector>

#include "audiotally/channel.hpp"
#include "audiotally/config.hpp"
#include "audiotally/pool.hpp"

namespace audiotally {

// ─── Statistics ─────────────────────────────────────────────────────────────

struct StatisticsRecord {
    size_t total_files = 0;
    size_t success_count = 0;
    size_t error_count = 0;
    double total_seconds = 0.0;
    double mean_seconds_per_file = 0.0;

    double total_hours() const { return total_seconds / 3600.0; }
    double mean_hours() const { return mean_seconds_per_file / 3600.0; }
    double mean_minutes() const { return mean_seconds_per_file / 60.0; }
};

// One slot per discovered file, indexed by Job::index.
using DurationTable = std::vector<double>;

struct FileFailure {
    size_t index;
    FileError error;
};

struct Aggregate {
    StatisticsRecord stats;
    DurationTable durations;
    std::vector<FileFailure> failures;    // sorted by index
    std::vector<size_t> mp3_early_stops;  // indices, sorted
};

// Drain `results` until it is closed and derive the statistics.
// Throws std::logic_error on an out-of-range or duplicate index.
Aggregate aggregate(Channel<Result> &results, size_t total_jobs,
                    CountingMode mode = CountingMode::Reported);

// Derive the statistics from an already-filled table. `failed[i]` marks
// slots whose result carried an error.
StatisticsRecord summarize(const DurationTable &durations,
                           const std::vector<bool> &failed,
                           CountingMode mode);

} // namespace audiotally
