#include "recomputer.hpp"

#include <iostream>
#include <utility>

namespace oplogstats {

void recomputerThread(
  HandoffQueue<std::string>& input,
  SummaryRecomputer& recomputer,
  bool quiet,
  Metrics& metrics,
  PipelineHalt& halt
) {
  std::string id;
  while (input.pop(id)) {
    const auto process_start = std::chrono::steady_clock::now();

    Summary summary;
    PipelineError error;
    if (!recomputer.recompute(id, summary, error)) {
      halt.abort(std::move(error));
      return;
    }

    metrics.addRecompute(elapsedMs(process_start));
    metrics.incrementUpserted();
    if (!quiet) {
      std::cout << "Summarized " << summary.key << "@" << summary.at << " from " << id
                << " (p50 " << summary.p50 << ")" << std::endl;
    }
  }
}

} // namespace oplogstats
