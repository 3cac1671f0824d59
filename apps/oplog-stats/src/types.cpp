#include "types.hpp"

#include <algorithm>

namespace oplogstats {

OperationKind operationFromCode(const std::string& code) {
  if (code == "i") {
    return OperationKind::kInsert;
  }
  if (code == "u") {
    return OperationKind::kUpdate;
  }
  if (code == "d") {
    return OperationKind::kDelete;
  }
  if (code == "c") {
    return OperationKind::kCommand;
  }
  if (code == "n") {
    return OperationKind::kNoop;
  }
  return OperationKind::kOther;
}

const char* operationCode(OperationKind kind) {
  switch (kind) {
    case OperationKind::kInsert:
      return "i";
    case OperationKind::kUpdate:
      return "u";
    case OperationKind::kDelete:
      return "d";
    case OperationKind::kCommand:
      return "c";
    case OperationKind::kNoop:
      return "n";
    default:
      return "?";
  }
}

bool ChangeFilter::matches(const ChangeRecord& record) const {
  if (inclusive ? record.position < after : !(after < record.position)) {
    return false;
  }
  if (!ns.empty() && record.ns != ns) {
    return false;
  }
  if (!operations.empty() &&
      std::find(operations.begin(), operations.end(), record.operation) == operations.end()) {
    return false;
  }
  return true;
}

} // namespace oplogstats
