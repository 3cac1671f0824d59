#ifndef OPLOG_STATS_HALT_HPP
#define OPLOG_STATS_HALT_HPP

#include <functional>
#include <mutex>
#include <optional>

#include "errors.hpp"

namespace oplogstats {

// Error channel shared by the stages of one pipeline run.
class PipelineHalt {
 public:
  explicit PipelineHalt(std::function<void()> teardown);

  // Keeps `error` if it is the first one; the run winds down by draining
  // what was already handed off.
  void report(PipelineError error);

  // Keeps `error` if it is the first one and tears the run down at once:
  // pending handoffs are discarded and the tail cursor is cancelled.
  void abort(PipelineError error);

  std::optional<PipelineError> error() const;

 private:
  FirstError first_;
  std::function<void()> teardown_;
  std::once_flag teardown_once_;
};

} // namespace oplogstats

#endif
