#ifndef OPLOG_STATS_COORDINATOR_HPP
#define OPLOG_STATS_COORDINATOR_HPP

#include <cstddef>

#include "backend.hpp"
#include "errors.hpp"
#include "metrics.hpp"

namespace oplogstats {

struct PipelineConfig {
  std::size_t queue_size = 1;
  bool quiet = false;
};

// Resolves the resume position, then runs tail -> extract -> recompute with
// one thread per stage until the tail ends or a stage fails.
class PipelineCoordinator {
 public:
  PipelineCoordinator(
    PipelineConfig config,
    ChangeSource& source,
    RawSeriesStore& raw_store,
    SummaryStore& summary_store
  );

  // false with the first error of the run; true only when the tail ended cleanly.
  bool run(Metrics& metrics, PipelineError& error);

 private:
  PipelineConfig config_;
  ChangeSource& source_;
  RawSeriesStore& raw_store_;
  SummaryStore& summary_store_;
};

} // namespace oplogstats

#endif
