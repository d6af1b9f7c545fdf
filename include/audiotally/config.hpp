#pragma once

namespace audiotally {

// ─── Success Counting ───────────────────────────────────────────────────────

enum class CountingMode {
    Reported,        // success = result carried no failure
    NonZeroDuration, // success = duration slot > 0 (legacy totals)
};

// ─── Worker Pool Config ─────────────────────────────────────────────────────

struct PoolConfig {
    int num_workers = 0; // 0 = detected core count
};

// ─── Run Config ─────────────────────────────────────────────────────────────

struct TallyConfig {
    PoolConfig pool;
    CountingMode counting = CountingMode::Reported;
    bool show_progress = true;
    bool verbose = false;
};

inline TallyConfig make_default_config() { return TallyConfig{}; }

// Legacy preset: a file counts as processed only when its duration came out
// greater than zero.
inline TallyConfig make_legacy_config() {
    TallyConfig cfg;
    cfg.counting = CountingMode::NonZeroDuration;
    return cfg;
}

// Resolve a requested worker count. Values <= 0 map to the detected core
// count, which itself falls back to 1 when the platform reports nothing.
int resolve_worker_count(int requested);

} // namespace audiotally
