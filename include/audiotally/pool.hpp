#pragma once

#include <functional>
#include <latch>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "audiotally/channel.hpp"
#include "audiotally/config.hpp"
#include "audiotally/duration.hpp"

namespace audiotally {

// ─── Job / Result ───────────────────────────────────────────────────────────

struct Job {
    std::string path;
    size_t index; // position in the discovery-ordered file list
};

struct Result {
    size_t index;
    double duration = 0.0; // seconds, 0 on failure
    std::optional<FileError> error;
    std::optional<Mp3Stop> mp3_stop;
};

using Resolver = std::function<DurationOutcome(const std::string &path)>;

// "Advance by one" signal. Must be safe to call from several workers at once.
using ProgressFn = std::function<void()>;

// ─── Worker Pool ────────────────────────────────────────────────────────────

/// Fixed set of worker threads draining a jobs channel into a results
/// channel.
///
///   Channel<Job> jobs(n);
///   Channel<Result> results(n);
///   WorkerPool pool(config.pool);
///   pool.start(jobs, results, progress);
///   ... send n jobs, jobs.close(), drain results ...
///   pool.wait();
///
/// Each worker emits exactly one Result and one progress signal per Job it
/// receives. The results channel is closed by a supervisor thread once every
/// worker has exited, so a consumer sees one result per job followed by a
/// clean end of stream.
class WorkerPool {
  public:
    explicit WorkerPool(const PoolConfig &config = {});
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // Spawn the workers. The channels must outlive wait().
    void start(Channel<Job> &jobs, Channel<Result> &results,
               ProgressFn progress = {}, Resolver resolver = resolve_duration);

    // Join every worker and the supervisor. Safe to call more than once.
    void wait();

    int num_workers() const { return num_workers_; }
    bool running() const { return started_ && !joined_; }

  private:
    void worker_loop(Channel<Job> &jobs, Channel<Result> &results,
                     const ProgressFn &progress, const Resolver &resolver);

    int num_workers_;
    bool started_ = false;
    bool joined_ = false;
    ProgressFn progress_;
    Resolver resolver_;
    std::unique_ptr<std::latch> done_;
    std::vector<std::thread> workers_;
    std::thread supervisor_;
};

} // namespace audiotally
