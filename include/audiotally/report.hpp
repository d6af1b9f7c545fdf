#pragma once

#include <string>

#include "audiotally/aggregate.hpp"

namespace audiotally {

// "=== Results ===" block: file counts, total hours, mean hours and minutes.
std::string format_report(const StatisticsRecord &stats);

} // namespace audiotally
