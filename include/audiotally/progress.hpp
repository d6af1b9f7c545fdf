#pragma once

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <mutex>
#include <string>

namespace audiotally {

// ─── Console Progress Bar ───────────────────────────────────────────────────

struct ProgressStyle {
    int width = 50;
    std::string description = "Processing files...";
    std::string unit = "files";
    bool color = true;
};

// Single-line bar redrawn with '\r':
//   Processing files... [=========>          ] 12/40 3.2 files/s
// advance() may be called from any thread.
class ConsoleProgress {
  public:
    ConsoleProgress(size_t total, std::ostream &out,
                    ProgressStyle style = {});

    void advance();
    void finish(); // draw the final state and end the line

    size_t current() const;
    size_t total() const { return total_; }

  private:
    void render_locked();

    size_t total_;
    std::ostream &out_;
    ProgressStyle style_;
    size_t current_ = 0;
    bool finished_ = false;
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex mutex_;
};

// Render one frame of the bar without any terminal control codes.
std::string render_progress_line(size_t current, size_t total,
                                 double rate_per_s, const ProgressStyle &style);

} // namespace audiotally
