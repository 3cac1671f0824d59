#ifndef OPLOG_STATS_FORMAT_HPP
#define OPLOG_STATS_FORMAT_HPP

#include <string>

#include "types.hpp"

namespace oplogstats {

std::string formatPosition(const OplogPosition& position);
std::string formatDocument(const oplog::v1::Document& document);
std::string formatRecord(const ChangeRecord& record);

} // namespace oplogstats

#endif
