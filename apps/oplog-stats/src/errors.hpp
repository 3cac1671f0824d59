#ifndef OPLOG_STATS_ERRORS_HPP
#define OPLOG_STATS_ERRORS_HPP

#include <mutex>
#include <optional>
#include <string>

namespace oplogstats {

enum class ErrorKind {
  kSourceUnavailable,
  kNoResumePoint,
  kStreamBroken,
  kNotFound,
  kPersistFailed,
};

const char* errorKindName(ErrorKind kind);

struct PipelineError {
  ErrorKind kind = ErrorKind::kSourceUnavailable;
  std::string stage;
  std::string message;
};

// "[stage] Kind: message"
std::string describe(const PipelineError& error);

// Keeps the first error reported by any stage; later reports are ignored.
class FirstError {
 public:
  bool record(PipelineError error);
  std::optional<PipelineError> get() const;

 private:
  mutable std::mutex mutex_;
  std::optional<PipelineError> error_;
};

} // namespace oplogstats

#endif
