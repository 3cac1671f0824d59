#ifndef OPLOG_STATS_METRICS_HPP
#define OPLOG_STATS_METRICS_HPP

#include <atomic>
#include <chrono>
#include <cstdint>

namespace oplogstats {

struct MetricsSnapshot {
  std::int64_t tailed_records = 0;
  std::int64_t extracted_ids = 0;
  std::int64_t dropped_records = 0;
  std::int64_t upserted_summaries = 0;
  double duration_sec = 0.0;
  double recompute_ms = 0.0;
  double handoff_wait_ms = 0.0;
};

class Metrics {
 public:
  void markStart();
  void markEnd();

  void incrementTailed();
  void incrementExtracted();
  void incrementDropped();
  void incrementUpserted();

  void addRecompute(double ms);
  void addHandoffWait(double ms);

  MetricsSnapshot snapshot() const;

 private:
  std::atomic<std::int64_t> tailed_records_{0};
  std::atomic<std::int64_t> extracted_ids_{0};
  std::atomic<std::int64_t> dropped_records_{0};
  std::atomic<std::int64_t> upserted_summaries_{0};
  std::atomic<std::int64_t> recompute_us_{0};
  std::atomic<std::int64_t> handoff_wait_us_{0};
  std::chrono::steady_clock::time_point start_{};
  std::chrono::steady_clock::time_point end_{};
  bool started_ = false;
  bool ended_ = false;
};

double elapsedMs(std::chrono::steady_clock::time_point since);

} // namespace oplogstats

#endif
