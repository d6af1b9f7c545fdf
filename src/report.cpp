#include "audiotally/report.hpp"

#include <iomanip>
#include <sstream>

namespace audiotally {

std::string format_report(const StatisticsRecord &stats) {
    std::ostringstream out;
    out << "=== Results ===\n";
    out << "Total files found: " << stats.total_files << "\n";
    out << "Successfully processed: " << stats.success_count << "\n";
    out << "Errors: " << stats.error_count << "\n";
    out << std::fixed << std::setprecision(2)
        << "Total audio duration: " << stats.total_hours() << " hours\n";
    out << "Mean audio duration per file: " << std::setprecision(4)
        << stats.mean_hours() << " hours (" << std::setprecision(2)
        << stats.mean_minutes() << " minutes)\n";
    return out.str();
}

} // namespace audiotally
