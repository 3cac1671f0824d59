#include <catch2/catch.hpp>

#include "resume.hpp"
#include "tests/memory_backend.hpp"

using namespace oplogstats;

TEST_CASE("resume position is the newest record", "[resume]") {
  testing::MemoryReplicationLog log;
  log.append(testing::insertRecord(10, "other.ns", "a"));
  log.append(testing::insertRecord(11, kRawNamespace, "b"));

  OplogPosition position;
  PipelineError error;
  REQUIRE(resolveResumePosition(log, position, error));
  REQUIRE(position == OplogPosition{11, 1});
}

TEST_CASE("an empty log has no resume point", "[resume]") {
  testing::MemoryReplicationLog log;

  OplogPosition position;
  PipelineError error;
  REQUIRE_FALSE(resolveResumePosition(log, position, error));
  REQUIRE(error.kind == ErrorKind::kNoResumePoint);
  REQUIRE(error.stage == "resume");
}

TEST_CASE("an unreachable log is reported as unavailable", "[resume]") {
  testing::MemoryReplicationLog log;
  log.append(testing::insertRecord(10, kRawNamespace, "a"));
  log.setUnavailable("connection refused");

  OplogPosition position;
  PipelineError error;
  REQUIRE_FALSE(resolveResumePosition(log, position, error));
  REQUIRE(error.kind == ErrorKind::kSourceUnavailable);
  REQUIRE(error.message == "connection refused");
}

TEST_CASE("pipeline filter wants later inserts and updates on the raw namespace", "[resume][filter]") {
  const ChangeFilter filter = pipelineFilter(OplogPosition{100, 3});

  REQUIRE_FALSE(filter.inclusive);
  REQUIRE(filter.ns == kRawNamespace);

  ChangeRecord record = testing::insertRecord(100, kRawNamespace, "a");

  record.position = OplogPosition{100, 3};
  REQUIRE_FALSE(filter.matches(record));
  record.position = OplogPosition{100, 2};
  REQUIRE_FALSE(filter.matches(record));
  record.position = OplogPosition{100, 4};
  REQUIRE(filter.matches(record));
  record.position = OplogPosition{101, 0};
  REQUIRE(filter.matches(record));

  record.operation = OperationKind::kUpdate;
  REQUIRE(filter.matches(record));
  record.operation = OperationKind::kDelete;
  REQUIRE_FALSE(filter.matches(record));
  record.operation = OperationKind::kNoop;
  REQUIRE_FALSE(filter.matches(record));

  record.operation = OperationKind::kInsert;
  record.ns = "metrics.summary";
  REQUIRE_FALSE(filter.matches(record));
}

TEST_CASE("inclusive filter without namespace matches everything from the position", "[filter]") {
  ChangeFilter filter;
  filter.after = OplogPosition{5, 0};
  filter.inclusive = true;

  ChangeRecord record;
  record.position = OplogPosition{5, 0};
  record.operation = OperationKind::kCommand;
  record.ns = "admin.$cmd";
  REQUIRE(filter.matches(record));

  record.position = OplogPosition{4, 9};
  REQUIRE_FALSE(filter.matches(record));
}
