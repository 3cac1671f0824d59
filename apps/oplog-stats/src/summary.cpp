#include "summary.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace oplogstats {

double empiricalQuantile(double p, const std::vector<double>& sorted) {
  if (sorted.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const double clamped = std::min(1.0, std::max(0.0, p));
  const double rank = clamped * static_cast<double>(sorted.size() - 1);
  const auto lower = static_cast<std::size_t>(std::floor(rank));
  const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
  const double fraction = rank - static_cast<double>(lower);
  if (fraction == 0.0) {
    return sorted[lower];
  }
  return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

Summary summarize(const RawSeries& raw) {
  std::vector<double> values;
  values.reserve(raw.values.size());
  for (const auto& datapoint : raw.values) {
    values.push_back(datapoint.value);
  }
  std::sort(values.begin(), values.end());

  Summary summary;
  summary.key = raw.key;
  summary.at = raw.at;
  summary.min = empiricalQuantile(0.0, values);
  summary.max = empiricalQuantile(1.0, values);
  summary.p2 = empiricalQuantile(0.02, values);
  summary.p9 = empiricalQuantile(0.09, values);
  summary.p25 = empiricalQuantile(0.25, values);
  summary.p50 = empiricalQuantile(0.50, values);
  summary.p75 = empiricalQuantile(0.75, values);
  summary.p91 = empiricalQuantile(0.91, values);
  summary.p98 = empiricalQuantile(0.98, values);
  return summary;
}

} // namespace oplogstats
