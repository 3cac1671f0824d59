#ifndef OPLOG_STATS_RECOMPUTER_THREAD_HPP
#define OPLOG_STATS_RECOMPUTER_THREAD_HPP

#include <string>

#include "../halt.hpp"
#include "../metrics.hpp"
#include "../queue.hpp"
#include "../recompute.hpp"

namespace oplogstats {

void recomputerThread(
  HandoffQueue<std::string>& input,
  SummaryRecomputer& recomputer,
  bool quiet,
  Metrics& metrics,
  PipelineHalt& halt
);

} // namespace oplogstats

#endif
