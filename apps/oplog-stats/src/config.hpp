#ifndef OPLOG_STATS_CONFIG_HPP
#define OPLOG_STATS_CONFIG_HPP

#include <cstddef>
#include <ostream>
#include <string>

namespace oplogstats {

constexpr const char* kStoreAddressEnv = "OPLOG_STATS_STORE_ADDRESS";
constexpr const char* kDefaultStoreAddress = "127.0.0.1:50070";

// Which executable is parsing: the diagnostic tail has no pipeline stages,
// so it takes no --queue-size or --quiet.
enum class Tool { kStats, kTail };

struct Config {
  std::string store_address = kDefaultStoreAddress;
  std::size_t queue_size = 1;
  int connect_timeout_seconds = 5;
  int rpc_timeout_seconds = 5;
  bool quiet = false;
  bool show_help = false;
};

// Default < $OPLOG_STATS_STORE_ADDRESS < --store-address.
bool parseArguments(int argc, char** argv, Config& config, std::string& error, Tool tool = Tool::kStats);

void printUsage(std::ostream& out, const std::string& program, Tool tool = Tool::kStats);

} // namespace oplogstats

#endif
