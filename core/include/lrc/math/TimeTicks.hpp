#pragma once
#include "lrc/model/ChartTypes.hpp"
#include <cstdint>
#include <vector>

namespace lrc {

// Nominal length of a history window in seconds (month = 30 days, year = 365).
std::int64_t durationSeconds(HistoryDuration d);

// `count` label times spread evenly over [from, to], both ends included.
// A degenerate span yields a single time; count < 1 yields none.
std::vector<std::int64_t> generateTimeTicks(std::int64_t from, std::int64_t to, int count);

} // namespace lrc
