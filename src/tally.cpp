#include "audiotally/tally.hpp"

namespace audiotally {

TallyResult tally_files(const std::vector<std::string> &paths,
                        const TallyConfig &config, ProgressFn progress,
                        Resolver resolver) {
    const size_t n = paths.size();

    // Both channels hold every item, so neither side ever blocks on a full
    // queue.
    Channel<Job> jobs(n);
    Channel<Result> results(n);

    WorkerPool pool(config.pool);
    pool.start(jobs, results, std::move(progress), std::move(resolver));

    for (size_t i = 0; i < n; ++i) {
        jobs.send(Job{paths[i], i});
    }
    jobs.close();

    auto agg = aggregate(results, n, config.counting);
    pool.wait();

    TallyResult out;
    out.stats = agg.stats;
    out.durations = std::move(agg.durations);
    out.num_workers = pool.num_workers();
    for (auto &f : agg.failures) {
        out.failures.push_back({paths[f.index], std::move(f.error)});
    }
    for (size_t idx : agg.mp3_early_stops) {
        out.mp3_early_stops.push_back(paths[idx]);
    }
    return out;
}

} // namespace audiotally
