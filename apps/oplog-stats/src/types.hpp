#ifndef OPLOG_STATS_TYPES_HPP
#define OPLOG_STATS_TYPES_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "oplog/v1/oplog.pb.h"

namespace oplogstats {

constexpr const char* kRawNamespace = "metrics.raw";
constexpr const char* kIdField = "_id";

struct OplogPosition {
  std::uint32_t seconds = 0;
  std::uint32_t ordinal = 0;
};

inline bool operator==(const OplogPosition& lhs, const OplogPosition& rhs) {
  return lhs.seconds == rhs.seconds && lhs.ordinal == rhs.ordinal;
}

inline bool operator!=(const OplogPosition& lhs, const OplogPosition& rhs) {
  return !(lhs == rhs);
}

inline bool operator<(const OplogPosition& lhs, const OplogPosition& rhs) {
  return lhs.seconds < rhs.seconds || (lhs.seconds == rhs.seconds && lhs.ordinal < rhs.ordinal);
}

enum class OperationKind { kInsert, kUpdate, kDelete, kCommand, kNoop, kOther };

OperationKind operationFromCode(const std::string& code);
const char* operationCode(OperationKind kind);

struct ChangeRecord {
  OplogPosition position;
  std::int64_t history_id = 0;
  int version = 0;
  OperationKind operation = OperationKind::kOther;
  std::string ns;
  oplog::v1::Document object;
  // Only populated for updates.
  oplog::v1::Document selector;
};

// Subscription predicate handed to a ChangeSource. Empty namespace or
// operation list matches everything.
struct ChangeFilter {
  OplogPosition after;
  bool inclusive = false;
  std::string ns;
  std::vector<OperationKind> operations;

  bool matches(const ChangeRecord& record) const;
};

struct Datapoint {
  std::int64_t at = 0;
  double value = 0.0;
};

struct RawSeries {
  std::string id;
  std::string key;
  std::int64_t at = 0;
  std::vector<Datapoint> values;
};

struct Summary {
  std::string key;
  std::int64_t at = 0;
  double min = 0.0;
  double max = 0.0;
  double p2 = 0.0;
  double p9 = 0.0;
  double p25 = 0.0;
  double p50 = 0.0;
  double p75 = 0.0;
  double p91 = 0.0;
  double p98 = 0.0;
};

} // namespace oplogstats

#endif
