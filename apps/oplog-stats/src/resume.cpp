#include "resume.hpp"

namespace oplogstats {

bool resolveResumePosition(ChangeSource& source, OplogPosition& out, PipelineError& error) {
  ChangeRecord latest;
  std::string message;
  switch (source.latest(latest, message)) {
    case LookupResult::kFound:
      out = latest.position;
      return true;
    case LookupResult::kNotFound:
      error = PipelineError{ErrorKind::kNoResumePoint, "resume", "replication log is empty"};
      return false;
    case LookupResult::kFailed:
      break;
  }
  error = PipelineError{ErrorKind::kSourceUnavailable, "resume", message};
  return false;
}

ChangeFilter pipelineFilter(const OplogPosition& resume) {
  ChangeFilter filter;
  filter.after = resume;
  filter.inclusive = false;
  filter.ns = kRawNamespace;
  filter.operations = {OperationKind::kInsert, OperationKind::kUpdate};
  return filter;
}

} // namespace oplogstats
