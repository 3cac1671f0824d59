#ifndef OPLOG_STATS_TAILER_HPP
#define OPLOG_STATS_TAILER_HPP

#include "../backend.hpp"
#include "../halt.hpp"
#include "../metrics.hpp"
#include "../queue.hpp"
#include "../types.hpp"

namespace oplogstats {

void tailerThread(
  ChangeCursor& cursor,
  HandoffQueue<ChangeRecord>& output,
  Metrics& metrics,
  PipelineHalt& halt
);

} // namespace oplogstats

#endif
