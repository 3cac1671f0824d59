#ifndef OPLOG_STATS_EXTRACTOR_HPP
#define OPLOG_STATS_EXTRACTOR_HPP

#include <string>

#include "../metrics.hpp"
#include "../queue.hpp"
#include "../types.hpp"

namespace oplogstats {

void extractorThread(
  HandoffQueue<ChangeRecord>& input,
  HandoffQueue<std::string>& output,
  Metrics& metrics
);

} // namespace oplogstats

#endif
