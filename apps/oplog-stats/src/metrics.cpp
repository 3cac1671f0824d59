#include "metrics.hpp"

namespace oplogstats {

void Metrics::markStart() {
  start_ = std::chrono::steady_clock::now();
  started_ = true;
}

void Metrics::markEnd() {
  end_ = std::chrono::steady_clock::now();
  ended_ = true;
}

void Metrics::incrementTailed() {
  tailed_records_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementExtracted() {
  extracted_ids_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementDropped() {
  dropped_records_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::incrementUpserted() {
  upserted_summaries_.fetch_add(1, std::memory_order_relaxed);
}

void Metrics::addRecompute(double ms) {
  recompute_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

void Metrics::addHandoffWait(double ms) {
  handoff_wait_us_.fetch_add(static_cast<std::int64_t>(ms * 1000), std::memory_order_relaxed);
}

MetricsSnapshot Metrics::snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.tailed_records = tailed_records_.load(std::memory_order_relaxed);
  snapshot.extracted_ids = extracted_ids_.load(std::memory_order_relaxed);
  snapshot.dropped_records = dropped_records_.load(std::memory_order_relaxed);
  snapshot.upserted_summaries = upserted_summaries_.load(std::memory_order_relaxed);
  snapshot.recompute_ms = recompute_us_.load(std::memory_order_relaxed) / 1000.0;
  snapshot.handoff_wait_ms = handoff_wait_us_.load(std::memory_order_relaxed) / 1000.0;

  if (started_ && ended_) {
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double>>(end_ - start_);
    snapshot.duration_sec = duration.count();
  }

  return snapshot;
}

double elapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(
           std::chrono::steady_clock::now() - since
  )
    .count();
}

} // namespace oplogstats
