#include <catch2/catch.hpp>

#include "grpc_backend.hpp"
#include "resume.hpp"

using namespace oplogstats;

TEST_CASE("oplog entries convert to change records", "[grpc]") {
  oplog::v1::OplogEntry entry;
  entry.mutable_ts()->set_seconds(1700000000);
  entry.mutable_ts()->set_ordinal(7);
  entry.set_h(123456789);
  entry.set_v(2);
  entry.set_op("u");
  entry.set_ns("metrics.raw");
  (*entry.mutable_o2()->mutable_fields())["_id"].set_string_value("abc");

  const ChangeRecord record = recordFromEntry(entry);

  REQUIRE(record.position == OplogPosition{1700000000, 7});
  REQUIRE(record.history_id == 123456789);
  REQUIRE(record.version == 2);
  REQUIRE(record.operation == OperationKind::kUpdate);
  REQUIRE(record.ns == "metrics.raw");
  REQUIRE(record.selector.fields().at("_id").string_value() == "abc");
  REQUIRE(record.object.fields().empty());
}

TEST_CASE("unknown operation codes are kept out of the pipeline", "[grpc]") {
  oplog::v1::OplogEntry entry;
  entry.set_op("x");
  REQUIRE(recordFromEntry(entry).operation == OperationKind::kOther);
}

TEST_CASE("the pipeline filter becomes an exclusive tail request", "[grpc]") {
  const oplog::v1::TailRequest request = tailRequestFromFilter(pipelineFilter(OplogPosition{9, 2}));

  REQUIRE(request.after().seconds() == 9);
  REQUIRE(request.after().ordinal() == 2);
  REQUIRE_FALSE(request.inclusive());
  REQUIRE(request.ns() == "metrics.raw");
  REQUIRE(request.ops_size() == 2);
  REQUIRE(request.ops(0) == "i");
  REQUIRE(request.ops(1) == "u");
}

TEST_CASE("raw series and summaries convert to and from the store protocol", "[grpc]") {
  metrics::v1::RawSeries proto;
  proto.set_id("5a1b00ff102030405060708c");
  proto.set_key("cpu.load");
  proto.set_at(1700000040);
  auto* point = proto.add_values();
  point->set_at(1700000041000);
  point->set_value(0.5);

  const RawSeries raw = rawFromProto(proto);
  REQUIRE(raw.key == "cpu.load");
  REQUIRE(raw.at == 1700000040);
  REQUIRE(raw.values.size() == 1);
  REQUIRE(raw.values[0].at == 1700000041000);
  REQUIRE(raw.values[0].value == 0.5);

  Summary summary;
  summary.key = "cpu.load";
  summary.at = 1700000040;
  summary.min = 0.5;
  summary.p50 = 0.75;
  summary.max = 1.0;
  const metrics::v1::Summary out = summaryToProto(summary);
  REQUIRE(out.key() == "cpu.load");
  REQUIRE(out.at() == 1700000040);
  REQUIRE(out.min() == 0.5);
  REQUIRE(out.p50() == 0.75);
  REQUIRE(out.max() == 1.0);
}
