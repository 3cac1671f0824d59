#include "coordinator.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "format.hpp"
#include "halt.hpp"
#include "queue.hpp"
#include "recompute.hpp"
#include "resume.hpp"
#include "threads/extractor.hpp"
#include "threads/recomputer.hpp"
#include "threads/tailer.hpp"

namespace oplogstats {

PipelineCoordinator::PipelineCoordinator(
  PipelineConfig config,
  ChangeSource& source,
  RawSeriesStore& raw_store,
  SummaryStore& summary_store
)
    : config_(config), source_(source), raw_store_(raw_store), summary_store_(summary_store) {}

bool PipelineCoordinator::run(Metrics& metrics, PipelineError& error) {
  metrics.markStart();

  OplogPosition resume;
  if (!resolveResumePosition(source_, resume, error)) {
    metrics.markEnd();
    return false;
  }
  if (!config_.quiet) {
    std::cout << "Tailing " << kRawNamespace << " after " << formatPosition(resume) << std::endl;
  }

  std::unique_ptr<ChangeCursor> cursor = source_.subscribe(pipelineFilter(resume));
  HandoffQueue<ChangeRecord> record_queue(config_.queue_size);
  HandoffQueue<std::string> id_queue(config_.queue_size);
  PipelineHalt halt([&]() {
    record_queue.cancel();
    id_queue.cancel();
    cursor->cancel();
  });
  SummaryRecomputer recomputer(raw_store_, summary_store_);

  std::thread tailer_thread(tailerThread, std::ref(*cursor), std::ref(record_queue), std::ref(metrics), std::ref(halt));
  std::thread extractor_thread(extractorThread, std::ref(record_queue), std::ref(id_queue), std::ref(metrics));
  std::thread recomputer_thread(
    recomputerThread,
    std::ref(id_queue),
    std::ref(recomputer),
    config_.quiet,
    std::ref(metrics),
    std::ref(halt)
  );

  tailer_thread.join();
  extractor_thread.join();
  recomputer_thread.join();

  metrics.markEnd();

  if (const auto first = halt.error()) {
    error = *first;
    return false;
  }
  return true;
}

} // namespace oplogstats
