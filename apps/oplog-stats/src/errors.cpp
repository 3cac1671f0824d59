#include "errors.hpp"

#include <utility>

namespace oplogstats {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kSourceUnavailable:
      return "SourceUnavailable";
    case ErrorKind::kNoResumePoint:
      return "NoResumePoint";
    case ErrorKind::kStreamBroken:
      return "StreamBroken";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kPersistFailed:
      return "PersistFailed";
  }
  return "Unknown";
}

std::string describe(const PipelineError& error) {
  std::string out = "[" + error.stage + "] " + errorKindName(error.kind);
  if (!error.message.empty()) {
    out += ": " + error.message;
  }
  return out;
}

bool FirstError::record(PipelineError error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_) {
    return false;
  }
  error_ = std::move(error);
  return true;
}

std::optional<PipelineError> FirstError::get() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

} // namespace oplogstats
