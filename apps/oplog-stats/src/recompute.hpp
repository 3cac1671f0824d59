#ifndef OPLOG_STATS_RECOMPUTE_HPP
#define OPLOG_STATS_RECOMPUTE_HPP

#include <string>

#include "backend.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace oplogstats {

// Loads a raw series, summarizes it and upserts the summary. Failures are
// returned as-is; nothing is retried here.
class SummaryRecomputer {
 public:
  SummaryRecomputer(RawSeriesStore& raw_store, SummaryStore& summary_store);

  bool recompute(const std::string& id, Summary& out, PipelineError& error);

 private:
  RawSeriesStore& raw_store_;
  SummaryStore& summary_store_;
};

} // namespace oplogstats

#endif
