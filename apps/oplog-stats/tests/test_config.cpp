#include <catch2/catch.hpp>

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"

using namespace oplogstats;

namespace {

bool parse(std::vector<std::string> args, Config& config, std::string& error, Tool tool = Tool::kStats) {
  args.insert(args.begin(), "oplog-stats");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  return parseArguments(static_cast<int>(argv.size()), argv.data(), config, error, tool);
}

} // namespace

TEST_CASE("defaults apply without arguments or environment", "[config]") {
  unsetenv(kStoreAddressEnv);
  Config config;
  std::string error;

  REQUIRE(parse({}, config, error));
  REQUIRE(config.store_address == kDefaultStoreAddress);
  REQUIRE(config.queue_size == 1);
  REQUIRE(config.rpc_timeout_seconds == 5);
  REQUIRE_FALSE(config.quiet);
  REQUIRE_FALSE(config.show_help);
}

TEST_CASE("store address comes from the environment, then the flag", "[config]") {
  setenv(kStoreAddressEnv, "replica:7000", 1);

  SECTION("environment overrides the default") {
    Config config;
    std::string error;
    REQUIRE(parse({}, config, error));
    REQUIRE(config.store_address == "replica:7000");
  }

  SECTION("flag overrides the environment") {
    Config config;
    std::string error;
    REQUIRE(parse({"--store-address", "primary:7001"}, config, error));
    REQUIRE(config.store_address == "primary:7001");
  }

  unsetenv(kStoreAddressEnv);
}

TEST_CASE("numeric flags and switches", "[config]") {
  unsetenv(kStoreAddressEnv);
  Config config;
  std::string error;

  REQUIRE(parse({"--queue-size", "16", "--rpc-timeout", "2", "--connect-timeout", "9", "--quiet"}, config, error));
  REQUIRE(config.queue_size == 16);
  REQUIRE(config.rpc_timeout_seconds == 2);
  REQUIRE(config.connect_timeout_seconds == 9);
  REQUIRE(config.quiet);
}

TEST_CASE("malformed arguments are rejected", "[config]") {
  Config config;
  std::string error;

  SECTION("missing value") {
    REQUIRE_FALSE(parse({"--store-address"}, config, error));
    REQUIRE(error == "Missing value for --store-address");
  }

  SECTION("non-positive queue size") {
    REQUIRE_FALSE(parse({"--queue-size", "0"}, config, error));
    REQUIRE(error == "Invalid value for --queue-size");
  }

  SECTION("trailing garbage") {
    REQUIRE_FALSE(parse({"--rpc-timeout", "5s"}, config, error));
  }

  SECTION("value wider than an int") {
    REQUIRE_FALSE(parse({"--rpc-timeout", "4294967297"}, config, error));
    REQUIRE(error == "Invalid value for --rpc-timeout");
    REQUIRE(config.rpc_timeout_seconds == 5);
  }

  SECTION("value past the range of long long") {
    REQUIRE_FALSE(parse({"--connect-timeout", "99999999999999999999999"}, config, error));
    REQUIRE(error == "Invalid value for --connect-timeout");
  }

  SECTION("unknown flag") {
    REQUIRE_FALSE(parse({"--mongo-url"}, config, error));
    REQUIRE(error == "Unknown argument: --mongo-url");
  }
}

TEST_CASE("help stops parsing", "[config]") {
  Config config;
  std::string error;
  REQUIRE(parse({"-h", "--bogus"}, config, error));
  REQUIRE(config.show_help);

  std::ostringstream usage;
  printUsage(usage, "oplog-stats");
  REQUIRE(usage.str().find("--store-address") != std::string::npos);
  REQUIRE(usage.str().find(kStoreAddressEnv) != std::string::npos);
}

TEST_CASE("the diagnostic tail takes no pipeline flags", "[config]") {
  unsetenv(kStoreAddressEnv);
  Config config;
  std::string error;

  SECTION("shared flags are accepted") {
    REQUIRE(parse({"--store-address", "replica:7000", "--rpc-timeout", "3"}, config, error, Tool::kTail));
    REQUIRE(config.store_address == "replica:7000");
    REQUIRE(config.rpc_timeout_seconds == 3);
  }

  SECTION("queue size is rejected") {
    REQUIRE_FALSE(parse({"--queue-size", "4"}, config, error, Tool::kTail));
    REQUIRE(error == "Unknown argument: --queue-size");
  }

  SECTION("quiet is rejected") {
    REQUIRE_FALSE(parse({"--quiet"}, config, error, Tool::kTail));
    REQUIRE(error == "Unknown argument: --quiet");
  }

  SECTION("usage lists only what the tail understands") {
    std::ostringstream usage;
    printUsage(usage, "oplog-tail", Tool::kTail);
    REQUIRE(usage.str().find("--store-address") != std::string::npos);
    REQUIRE(usage.str().find("--rpc-timeout") != std::string::npos);
    REQUIRE(usage.str().find("--queue-size") == std::string::npos);
    REQUIRE(usage.str().find("--quiet") == std::string::npos);
  }
}
