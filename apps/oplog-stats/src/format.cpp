#include "format.hpp"

#include <algorithm>
#include <sstream>
#include <vector>

#include "extract.hpp"

namespace oplogstats {

namespace {

void writeDocument(std::ostringstream& out, const oplog::v1::Document& document);

void writeValue(std::ostringstream& out, const oplog::v1::Value& value) {
  switch (value.kind_case()) {
    case oplog::v1::Value::kStringValue:
      out << '"' << value.string_value() << '"';
      break;
    case oplog::v1::Value::kDoubleValue:
      out << value.double_value();
      break;
    case oplog::v1::Value::kInt64Value:
      out << value.int64_value();
      break;
    case oplog::v1::Value::kBoolValue:
      out << (value.bool_value() ? "true" : "false");
      break;
    case oplog::v1::Value::kObjectIdValue:
      out << "ObjectId(\"" << objectIdHex(value.object_id_value()) << "\")";
      break;
    case oplog::v1::Value::kDatetimeValue:
      out << "Date(" << value.datetime_value() << ")";
      break;
    case oplog::v1::Value::kDocumentValue:
      writeDocument(out, value.document_value());
      break;
    case oplog::v1::Value::kListValue: {
      out << '[';
      bool first = true;
      for (const auto& item : value.list_value().values()) {
        if (!first) {
          out << ", ";
        }
        first = false;
        writeValue(out, item);
      }
      out << ']';
      break;
    }
    default:
      out << "null";
      break;
  }
}

void writeDocument(std::ostringstream& out, const oplog::v1::Document& document) {
  // map iteration order is unspecified; print keys sorted
  std::vector<const std::string*> keys;
  keys.reserve(document.fields_size());
  for (const auto& field : document.fields()) {
    keys.push_back(&field.first);
  }
  std::sort(keys.begin(), keys.end(), [](const std::string* a, const std::string* b) { return *a < *b; });

  out << '{';
  bool first = true;
  for (const std::string* key : keys) {
    if (!first) {
      out << ", ";
    }
    first = false;
    out << *key << ": ";
    writeValue(out, document.fields().at(*key));
  }
  out << '}';
}

} // namespace

std::string formatPosition(const OplogPosition& position) {
  return "Timestamp(" + std::to_string(position.seconds) + ", " + std::to_string(position.ordinal) + ")";
}

std::string formatDocument(const oplog::v1::Document& document) {
  std::ostringstream out;
  writeDocument(out, document);
  return out.str();
}

std::string formatRecord(const ChangeRecord& record) {
  std::ostringstream out;
  out << "{ts: " << formatPosition(record.position) << ", h: " << record.history_id
      << ", v: " << record.version << ", op: " << operationCode(record.operation)
      << ", ns: " << record.ns << ", o: ";
  writeDocument(out, record.object);
  out << ", o2: ";
  writeDocument(out, record.selector);
  out << '}';
  return out.str();
}

} // namespace oplogstats
