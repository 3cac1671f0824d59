#include "config.hpp"

#include <cstdlib>
#include <limits>

namespace oplogstats
{

  namespace
  {

    bool parsePositive(const std::string &value, long long &out)
    {
      char *end = nullptr;
      const long long parsed = std::strtoll(value.c_str(), &end, 10);
      if (end == value.c_str() || *end != '\0' || parsed <= 0 || parsed > std::numeric_limits<int>::max())
      {
        return false;
      }
      out = parsed;
      return true;
    }

    bool takeValue(int argc, char **argv, int &i, const std::string &flag, std::string &out, std::string &error)
    {
      if (i + 1 >= argc)
      {
        error = "Missing value for " + flag;
        return false;
      }
      out = argv[i + 1];
      i += 1;
      return true;
    }

  } // namespace

  bool parseArguments(int argc, char **argv, Config &config, std::string &error, Tool tool)
  {
    const char *env_value = std::getenv(kStoreAddressEnv);
    if (env_value != nullptr && !std::string(env_value).empty())
    {
      config.store_address = env_value;
    }

    for (int i = 1; i < argc; i += 1)
    {
      const std::string arg = argv[i];

      if (arg == "--help" || arg == "-h")
      {
        config.show_help = true;
        return true;
      }

      const bool stats_only = arg == "--quiet" || arg == "--queue-size";
      if (stats_only && tool != Tool::kStats)
      {
        error = "Unknown argument: " + arg;
        return false;
      }

      if (arg == "--quiet")
      {
        config.quiet = true;
        continue;
      }

      if (arg == "--store-address")
      {
        if (!takeValue(argc, argv, i, arg, config.store_address, error))
        {
          return false;
        }
        if (config.store_address.empty())
        {
          error = "Empty value for --store-address";
          return false;
        }
        continue;
      }

      if (arg == "--queue-size" || arg == "--connect-timeout" || arg == "--rpc-timeout")
      {
        std::string raw;
        long long value = 0;
        if (!takeValue(argc, argv, i, arg, raw, error))
        {
          return false;
        }
        if (!parsePositive(raw, value))
        {
          error = "Invalid value for " + arg;
          return false;
        }
        if (arg == "--queue-size")
        {
          config.queue_size = static_cast<std::size_t>(value);
        }
        else if (arg == "--connect-timeout")
        {
          config.connect_timeout_seconds = static_cast<int>(value);
        }
        else
        {
          config.rpc_timeout_seconds = static_cast<int>(value);
        }
        continue;
      }

      error = "Unknown argument: " + arg;
      return false;
    }

    return true;
  }

  void printUsage(std::ostream &out, const std::string &program, Tool tool)
  {
    out << "Usage: " << program << " [options]\n\n"
        << "Options:\n"
        << "  --store-address <addr>   Backend address (default: " << kDefaultStoreAddress << ",\n"
        << "                           or $" << kStoreAddressEnv << ")\n";
    if (tool == Tool::kStats)
    {
      out << "  --queue-size <num>       Handoff capacity per stage (default: 1)\n";
    }
    out << "  --connect-timeout <sec>  Wait for the backend channel (default: 5)\n"
        << "  --rpc-timeout <sec>      Deadline of unary calls (default: 5)\n";
    if (tool == Tool::kStats)
    {
      out << "  --quiet                  No per-summary progress lines\n";
    }
    out << "  -h, --help               Show this help message\n";
  }

} // namespace oplogstats
