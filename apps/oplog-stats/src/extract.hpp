#ifndef OPLOG_STATS_EXTRACT_HPP
#define OPLOG_STATS_EXTRACT_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace oplogstats {

// Identifier of the entity a record touched: `_id` of the inserted object,
// or `_id` of the update selector. Object ids come back as lower-case hex,
// strings as-is. Records without a usable `_id` (absent, another type, or
// an object id that is not 12 bytes) yield nothing.
std::optional<std::string> extractEntityId(const ChangeRecord& record);

std::string objectIdHex(const std::string& bytes);

} // namespace oplogstats

#endif
