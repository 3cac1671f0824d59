#ifndef OPLOG_STATS_SUMMARY_HPP
#define OPLOG_STATS_SUMMARY_HPP

#include <vector>

#include "types.hpp"

namespace oplogstats {

// p-th quantile (p in [0, 1]) of an ascending sample, linearly interpolated
// at rank p * (n - 1). NaN for an empty sample.
double empiricalQuantile(double p, const std::vector<double>& sorted);

// Seven-number summary of a raw series, keyed by the series' (key, at).
Summary summarize(const RawSeries& raw);

} // namespace oplogstats

#endif
