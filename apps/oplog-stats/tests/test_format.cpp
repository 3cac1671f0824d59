#include <catch2/catch.hpp>

#include <string>

#include "errors.hpp"
#include "format.hpp"
#include "tests/memory_backend.hpp"

using namespace oplogstats;

TEST_CASE("records print with sorted document keys", "[format]") {
  ChangeRecord record = testing::updateRecord(1700000000, kRawNamespace, "abc");
  record.position.ordinal = 4;
  record.history_id = -42;
  record.version = 2;

  REQUIRE(
    formatRecord(record) ==
    "{ts: Timestamp(1700000000, 4), h: -42, v: 2, op: u, ns: metrics.raw, "
    "o: {$set: {value: 7}}, o2: {_id: \"abc\"}}"
  );
}

TEST_CASE("documents print every value kind", "[format]") {
  oplog::v1::Document document;
  auto& fields = *document.mutable_fields();
  fields["b"].set_bool_value(true);
  fields["d"].set_datetime_value(1000);
  fields["i"].set_int64_value(-3);
  fields["o"].set_object_id_value(std::string(12, '\x01'));
  auto* list = fields["l"].mutable_list_value();
  list->add_values()->set_string_value("x");
  list->add_values()->set_double_value(1.5);

  REQUIRE(
    formatDocument(document) ==
    "{b: true, d: Date(1000), i: -3, l: [\"x\", 1.5], o: ObjectId(\"010101010101010101010101\")}"
  );
}

TEST_CASE("errors describe stage and kind", "[errors]") {
  REQUIRE(describe(PipelineError{ErrorKind::kStreamBroken, "tail", "connection reset"}) ==
          "[tail] StreamBroken: connection reset");
  REQUIRE(describe(PipelineError{ErrorKind::kNoResumePoint, "resume", ""}) == "[resume] NoResumePoint");
}

TEST_CASE("only the first error is kept", "[errors]") {
  FirstError first;
  REQUIRE_FALSE(first.get());

  REQUIRE(first.record(PipelineError{ErrorKind::kNotFound, "recompute", "k1"}));
  REQUIRE_FALSE(first.record(PipelineError{ErrorKind::kStreamBroken, "tail", "cancelled"}));

  REQUIRE(first.get()->kind == ErrorKind::kNotFound);
}
