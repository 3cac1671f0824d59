#include "extract.hpp"

#include <cstddef>

namespace oplogstats {

namespace {

constexpr std::size_t kObjectIdSize = 12;

std::optional<std::string> idField(const oplog::v1::Document& document) {
  const auto& fields = document.fields();
  const auto it = fields.find(std::string(kIdField));
  if (it == fields.end()) {
    return std::nullopt;
  }
  const oplog::v1::Value& id = it->second;
  switch (id.kind_case()) {
    case oplog::v1::Value::kObjectIdValue:
      if (id.object_id_value().size() != kObjectIdSize) {
        return std::nullopt;
      }
      return objectIdHex(id.object_id_value());
    case oplog::v1::Value::kStringValue:
      return id.string_value();
    default:
      return std::nullopt;
  }
}

} // namespace

std::optional<std::string> extractEntityId(const ChangeRecord& record) {
  switch (record.operation) {
    case OperationKind::kInsert:
      return idField(record.object);
    case OperationKind::kUpdate:
      // the payload of an update may be a partial delta, the selector is not
      return idField(record.selector);
    default:
      return std::nullopt;
  }
}

std::string objectIdHex(const std::string& bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(bytes.size() * 2);
  for (const char c : bytes) {
    const auto byte = static_cast<unsigned char>(c);
    hex.push_back(kDigits[byte >> 4]);
    hex.push_back(kDigits[byte & 0x0f]);
  }
  return hex;
}

} // namespace oplogstats
