#include "recompute.hpp"

#include "summary.hpp"

namespace oplogstats {

SummaryRecomputer::SummaryRecomputer(RawSeriesStore& raw_store, SummaryStore& summary_store)
    : raw_store_(raw_store), summary_store_(summary_store) {}

bool SummaryRecomputer::recompute(const std::string& id, Summary& out, PipelineError& error) {
  RawSeries raw;
  std::string message;
  switch (raw_store_.findRaw(id, raw, message)) {
    case LookupResult::kFound:
      break;
    case LookupResult::kNotFound:
      error = PipelineError{ErrorKind::kNotFound, "recompute", "raw series " + id + " not found"};
      return false;
    case LookupResult::kFailed:
      error = PipelineError{ErrorKind::kSourceUnavailable, "recompute", "loading " + id + ": " + message};
      return false;
  }

  out = summarize(raw);
  if (!summary_store_.upsertSummary(out, message)) {
    error = PipelineError{
      ErrorKind::kPersistFailed,
      "recompute",
      "upserting " + out.key + "@" + std::to_string(out.at) + ": " + message
    };
    return false;
  }
  return true;
}

} // namespace oplogstats
