#include "audiotally/aggregate.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace audiotally {

StatisticsRecord summarize(const DurationTable &durations,
                           const std::vector<bool> &failed,
                           CountingMode mode) {
    StatisticsRecord stats;
    stats.total_files = durations.size();

    // Summed in index order so the total does not depend on which worker
    // finished first.
    for (size_t i = 0; i < durations.size(); ++i) {
        bool is_failed = i < failed.size() && failed[i];
        if (is_failed)
            stats.error_count++;

        bool counted = (mode == CountingMode::NonZeroDuration)
                           ? durations[i] > 0.0
                           : !is_failed;
        if (counted) {
            stats.total_seconds += durations[i];
            stats.success_count++;
        }
    }

    if (stats.success_count > 0) {
        stats.mean_seconds_per_file =
            stats.total_seconds / static_cast<double>(stats.success_count);
    }
    return stats;
}

Aggregate aggregate(Channel<Result> &results, size_t total_jobs,
                    CountingMode mode) {
    Aggregate agg;
    agg.durations.assign(total_jobs, 0.0);
    std::vector<bool> failed(total_jobs, false);
    std::vector<bool> seen(total_jobs, false);

    while (auto res = results.receive()) {
        if (res->index >= total_jobs) {
            throw std::logic_error("result index " +
                                   std::to_string(res->index) +
                                   " out of range");
        }
        if (seen[res->index]) {
            throw std::logic_error("duplicate result for index " +
                                   std::to_string(res->index));
        }
        seen[res->index] = true;

        if (res->error) {
            failed[res->index] = true;
            agg.failures.push_back({res->index, std::move(*res->error)});
        } else {
            agg.durations[res->index] = res->duration;
        }
        if (res->mp3_stop == Mp3Stop::StoppedEarly)
            agg.mp3_early_stops.push_back(res->index);
    }

    std::sort(agg.failures.begin(), agg.failures.end(),
              [](const FileFailure &a, const FileFailure &b) {
                  return a.index < b.index;
              });
    std::sort(agg.mp3_early_stops.begin(), agg.mp3_early_stops.end());

    agg.stats = summarize(agg.durations, failed, mode);
    return agg;
}

} // namespace audiotally
