#include "audiotally/pool.hpp"

#include <stdexcept>

namespace audiotally {

int resolve_worker_count(int requested) {
    if (requested > 0)
        return requested;
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<int>(cores) : 1;
}

// ─── Worker Pool ────────────────────────────────────────────────────────────

WorkerPool::WorkerPool(const PoolConfig &config)
    : num_workers_(resolve_worker_count(config.num_workers)) {}

WorkerPool::~WorkerPool() { wait(); }

void WorkerPool::start(Channel<Job> &jobs, Channel<Result> &results,
                       ProgressFn progress, Resolver resolver) {
    if (started_) {
        throw std::logic_error("WorkerPool::start called twice");
    }
    if (!resolver) {
        throw std::invalid_argument("WorkerPool::start: empty resolver");
    }
    started_ = true;
    progress_ = std::move(progress);
    resolver_ = std::move(resolver);
    done_ = std::make_unique<std::latch>(num_workers_);

    workers_.reserve(num_workers_);
    for (int i = 0; i < num_workers_; ++i) {
        workers_.emplace_back([this, &jobs, &results] {
            worker_loop(jobs, results, progress_, resolver_);
            done_->count_down();
        });
    }

    // Close results only once every worker has exited.
    supervisor_ = std::thread([this, &results] {
        done_->wait();
        results.close();
    });
}

void WorkerPool::wait() {
    if (!started_ || joined_)
        return;
    for (auto &w : workers_) {
        if (w.joinable())
            w.join();
    }
    if (supervisor_.joinable())
        supervisor_.join();
    joined_ = true;
}

void WorkerPool::worker_loop(Channel<Job> &jobs, Channel<Result> &results,
                             const ProgressFn &progress,
                             const Resolver &resolver) {
    while (auto job = jobs.receive()) {
        Result res{job->index};
        try {
            auto outcome = resolver(job->path);
            res.error = std::move(outcome.error);
            res.mp3_stop = outcome.mp3_stop;
            if (!res.error)
                res.duration = outcome.seconds;
        } catch (const std::exception &e) {
            // A resolver other than resolve_duration may throw; the job
            // still gets exactly one result.
            res.error = FileError{ErrorKind::Malformed, e.what()};
        }

        results.send(std::move(res));
        if (progress)
            progress();
    }
}

} // namespace audiotally
