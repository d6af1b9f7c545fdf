#include "audiotally/progress.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace audiotally {

namespace {

const char *const CYAN = "\033[36m";
const char *const GREEN = "\033[32m";
const char *const RESET = "\033[0m";

} // namespace

std::string render_progress_line(size_t current, size_t total,
                                 double rate_per_s,
                                 const ProgressStyle &style) {
    int width = std::max(style.width, 1);
    int filled = 0;
    if (total > 0) {
        filled = static_cast<int>(
            (static_cast<double>(std::min(current, total)) / total) * width);
    }

    std::ostringstream line;
    line << style.description << " [";
    for (int i = 0; i < width; ++i) {
        if (i < filled - 1 || (i == filled - 1 && current >= total))
            line << '=';
        else if (i == filled - 1)
            line << '>';
        else
            line << ' ';
    }
    line << "] " << current << "/" << total << " " << std::fixed
         << std::setprecision(1) << rate_per_s << " " << style.unit << "/s";
    return line.str();
}

// ─── Console Progress Bar ───────────────────────────────────────────────────

ConsoleProgress::ConsoleProgress(size_t total, std::ostream &out,
                                 ProgressStyle style)
    : total_(total), out_(out), style_(std::move(style)),
      start_(std::chrono::steady_clock::now()) {
    std::lock_guard<std::mutex> lock(mutex_);
    render_locked();
}

void ConsoleProgress::advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_)
        return;
    if (current_ < total_)
        current_++;
    render_locked();
}

void ConsoleProgress::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (finished_)
        return;
    render_locked();
    out_ << std::endl;
    finished_ = true;
}

size_t ConsoleProgress::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ConsoleProgress::render_locked() {
    double elapsed = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start_)
                         .count();
    double rate = elapsed > 0.0 ? static_cast<double>(current_) / elapsed : 0.0;

    std::string line = render_progress_line(current_, total_, rate, style_);
    out_ << '\r';
    if (style_.color) {
        // Color the description and the bar body
        auto bracket = line.find(" [");
        auto close = line.find("] ");
        out_ << CYAN << line.substr(0, bracket) << RESET << " [" << GREEN
             << line.substr(bracket + 2, close - bracket - 2) << RESET
             << line.substr(close);
    } else {
        out_ << line;
    }
    out_ << std::flush;
}

} // namespace audiotally
