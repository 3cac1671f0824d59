#ifndef OPLOG_STATS_BACKEND_HPP
#define OPLOG_STATS_BACKEND_HPP

#include <memory>
#include <string>

#include "types.hpp"

namespace oplogstats {

enum class LookupResult { kFound, kNotFound, kFailed };

// Live subscription to the replicated log.
class ChangeCursor {
 public:
  virtual ~ChangeCursor() = default;

  // Blocks until the next matching record arrives. Returns false once the
  // stream is over; finish() then reports how it ended.
  virtual bool next(ChangeRecord& out) = 0;

  // true for a clean end of stream, false with `error` set otherwise.
  virtual bool finish(std::string& error) = 0;

  // Wakes a next() blocked in another thread. Safe to call more than once.
  virtual void cancel() = 0;
};

class ChangeSource {
 public:
  virtual ~ChangeSource() = default;

  // Most recent record in the log; kNotFound when the log is empty.
  virtual LookupResult latest(ChangeRecord& out, std::string& error) = 0;

  virtual std::unique_ptr<ChangeCursor> subscribe(const ChangeFilter& filter) = 0;
};

class RawSeriesStore {
 public:
  virtual ~RawSeriesStore() = default;

  virtual LookupResult findRaw(const std::string& id, RawSeries& out, std::string& error) = 0;
};

class SummaryStore {
 public:
  virtual ~SummaryStore() = default;

  // Atomically replaces the summary stored under (key, at), or inserts it.
  virtual bool upsertSummary(const Summary& summary, std::string& error) = 0;
};

} // namespace oplogstats

#endif
