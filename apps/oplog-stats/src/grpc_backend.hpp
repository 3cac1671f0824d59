#ifndef OPLOG_STATS_GRPC_BACKEND_HPP
#define OPLOG_STATS_GRPC_BACKEND_HPP

#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "backend.hpp"
#include "errors.hpp"
#include "metrics/v1/metrics.grpc.pb.h"
#include "oplog/v1/oplog.grpc.pb.h"

namespace oplogstats {

// Opens an insecure channel to the backend and waits up to
// `connect_timeout_seconds` for it to become ready.
bool connectBackend(
  const std::string& address,
  int connect_timeout_seconds,
  std::shared_ptr<grpc::Channel>& out,
  PipelineError& error
);

ChangeRecord recordFromEntry(const oplog::v1::OplogEntry& entry);
oplog::v1::TailRequest tailRequestFromFilter(const ChangeFilter& filter);
RawSeries rawFromProto(const metrics::v1::RawSeries& raw);
metrics::v1::Summary summaryToProto(const Summary& summary);

class GrpcChangeSource : public ChangeSource {
 public:
  GrpcChangeSource(const std::shared_ptr<grpc::Channel>& channel, int rpc_timeout_seconds);

  LookupResult latest(ChangeRecord& out, std::string& error) override;
  std::unique_ptr<ChangeCursor> subscribe(const ChangeFilter& filter) override;

 private:
  std::unique_ptr<oplog::v1::ReplicationLogService::Stub> stub_;
  int rpc_timeout_seconds_;
};

class GrpcMetricsStore : public RawSeriesStore, public SummaryStore {
 public:
  GrpcMetricsStore(const std::shared_ptr<grpc::Channel>& channel, int rpc_timeout_seconds);

  LookupResult findRaw(const std::string& id, RawSeries& out, std::string& error) override;
  bool upsertSummary(const Summary& summary, std::string& error) override;

 private:
  std::unique_ptr<metrics::v1::MetricsStoreService::Stub> stub_;
  int rpc_timeout_seconds_;
};

} // namespace oplogstats

#endif
