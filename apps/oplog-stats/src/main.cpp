#include <iostream>
#include <memory>
#include <string>

#include "config.hpp"
#include "coordinator.hpp"
#include "grpc_backend.hpp"
#include "metrics.hpp"

namespace
{

  void printReport(const oplogstats::MetricsSnapshot &snapshot)
  {
    std::cout << "\n=== Oplog Stats ===\n"
              << "Tailed: " << snapshot.tailed_records << " records\n"
              << "Extracted: " << snapshot.extracted_ids << " ids\n"
              << "Dropped: " << snapshot.dropped_records << " records\n"
              << "Upserted: " << snapshot.upserted_summaries << " summaries\n"
              << "Duration: " << snapshot.duration_sec << " sec\n"
              << "Recompute: " << snapshot.recompute_ms << "ms\n"
              << "Handoff wait: " << snapshot.handoff_wait_ms << "ms\n";
  }

} // namespace

int main(int argc, char **argv)
{
  oplogstats::Config config;
  std::string error;
  if (!oplogstats::parseArguments(argc, argv, config, error))
  {
    std::cerr << error << "\n\n";
    oplogstats::printUsage(std::cerr, argv[0]);
    return 2;
  }
  if (config.show_help)
  {
    oplogstats::printUsage(std::cout, argv[0]);
    return 0;
  }

  std::cout << "Connecting to store at " << config.store_address << std::endl;
  std::shared_ptr<grpc::Channel> channel;
  oplogstats::PipelineError failure;
  if (!oplogstats::connectBackend(config.store_address, config.connect_timeout_seconds, channel, failure))
  {
    std::cerr << "fatal: " << oplogstats::describe(failure) << std::endl;
    return 1;
  }

  oplogstats::GrpcChangeSource source(channel, config.rpc_timeout_seconds);
  oplogstats::GrpcMetricsStore store(channel, config.rpc_timeout_seconds);

  oplogstats::PipelineConfig pipeline_config;
  pipeline_config.queue_size = config.queue_size;
  pipeline_config.quiet = config.quiet;

  oplogstats::Metrics metrics;
  oplogstats::PipelineCoordinator coordinator(pipeline_config, source, store, store);
  const bool ok = coordinator.run(metrics, failure);

  printReport(metrics.snapshot());

  if (!ok)
  {
    std::cerr << "fatal: " << oplogstats::describe(failure) << std::endl;
    return 1;
  }
  return 0;
}
