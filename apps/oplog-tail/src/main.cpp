#include <iostream>
#include <memory>
#include <string>

#include "config.hpp"
#include "format.hpp"
#include "grpc_backend.hpp"

// Echoes every replication log entry from the newest one onwards.
int main(int argc, char **argv)
{
  oplogstats::Config config;
  std::string error;
  if (!oplogstats::parseArguments(argc, argv, config, error, oplogstats::Tool::kTail))
  {
    std::cerr << error << "\n\n";
    oplogstats::printUsage(std::cerr, argv[0], oplogstats::Tool::kTail);
    return 2;
  }
  if (config.show_help)
  {
    oplogstats::printUsage(std::cout, argv[0], oplogstats::Tool::kTail);
    return 0;
  }

  std::shared_ptr<grpc::Channel> channel;
  oplogstats::PipelineError failure;
  if (!oplogstats::connectBackend(config.store_address, config.connect_timeout_seconds, channel, failure))
  {
    std::cerr << "fatal: " << oplogstats::describe(failure) << std::endl;
    return 1;
  }

  oplogstats::GrpcChangeSource source(channel, config.rpc_timeout_seconds);

  oplogstats::ChangeRecord latest;
  switch (source.latest(latest, error))
  {
  case oplogstats::LookupResult::kFound:
    break;
  case oplogstats::LookupResult::kNotFound:
    std::cerr << "fatal: replication log is empty" << std::endl;
    return 1;
  case oplogstats::LookupResult::kFailed:
    std::cerr << "fatal: " << error << std::endl;
    return 1;
  }

  oplogstats::ChangeFilter filter;
  filter.after = latest.position;
  filter.inclusive = true;

  auto cursor = source.subscribe(filter);
  oplogstats::ChangeRecord record;
  while (cursor->next(record))
  {
    std::cout << oplogstats::formatRecord(record) << std::endl;
  }
  if (!cursor->finish(error))
  {
    std::cerr << "fatal: tail stream broken: " << error << std::endl;
    return 1;
  }
  return 0;
}
