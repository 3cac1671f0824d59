#include "tailer.hpp"

#include <string>
#include <utility>

namespace oplogstats {

void tailerThread(
  ChangeCursor& cursor,
  HandoffQueue<ChangeRecord>& output,
  Metrics& metrics,
  PipelineHalt& halt
) {
  ChangeRecord record;
  while (cursor.next(record)) {
    metrics.incrementTailed();
    const auto wait_start = std::chrono::steady_clock::now();
    if (!output.push(std::move(record))) {
      break;
    }
    metrics.addHandoffWait(elapsedMs(wait_start));
  }

  if (output.cancelled()) {
    return;
  }

  std::string message;
  if (!cursor.finish(message)) {
    // records already handed off are still summarized before the run ends
    halt.report(PipelineError{ErrorKind::kStreamBroken, "tail", message});
  }
  output.close();
}

} // namespace oplogstats
