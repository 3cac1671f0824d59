#include "grpc_backend.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace oplogstats {

namespace {

std::string statusText(const grpc::Status& status) {
  std::string text = status.error_message();
  if (text.empty()) {
    text = "rpc failed";
  }
  return text + " (code " + std::to_string(static_cast<int>(status.error_code())) + ")";
}

void setDeadline(grpc::ClientContext& context, int seconds) {
  context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(seconds));
}

// Server-streaming Tail call. The context has no deadline: the stream is
// expected to stay open for the life of the process.
class GrpcChangeCursor : public ChangeCursor {
 public:
  GrpcChangeCursor(oplog::v1::ReplicationLogService::Stub& stub, const oplog::v1::TailRequest& request) {
    reader_ = stub.Tail(&context_, request);
  }

  ~GrpcChangeCursor() override {
    if (finished_) {
      return;
    }
    context_.TryCancel();
    oplog::v1::OplogEntry entry;
    while (reader_->Read(&entry)) {
    }
    const grpc::Status status = reader_->Finish();
    if (!status.ok() && status.error_code() != grpc::StatusCode::CANCELLED) {
      std::cerr << "Tail stream closed with " << statusText(status) << "\n";
    }
  }

  bool next(ChangeRecord& out) override {
    oplog::v1::OplogEntry entry;
    if (!reader_->Read(&entry)) {
      return false;
    }
    out = recordFromEntry(entry);
    return true;
  }

  bool finish(std::string& error) override {
    finished_ = true;
    const grpc::Status status = reader_->Finish();
    if (!status.ok()) {
      error = statusText(status);
      return false;
    }
    return true;
  }

  void cancel() override { context_.TryCancel(); }

 private:
  grpc::ClientContext context_;
  std::unique_ptr<grpc::ClientReader<oplog::v1::OplogEntry>> reader_;
  bool finished_ = false;
};

} // namespace

bool connectBackend(
  const std::string& address,
  int connect_timeout_seconds,
  std::shared_ptr<grpc::Channel>& out,
  PipelineError& error
) {
  auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  const auto deadline = std::chrono::system_clock::now() + std::chrono::seconds(connect_timeout_seconds);
  if (!channel->WaitForConnected(deadline)) {
    error = PipelineError{
      ErrorKind::kSourceUnavailable,
      "connect",
      address + " not ready (timeout " + std::to_string(connect_timeout_seconds) + "s)"
    };
    return false;
  }
  out = std::move(channel);
  return true;
}

ChangeRecord recordFromEntry(const oplog::v1::OplogEntry& entry) {
  ChangeRecord record;
  record.position.seconds = entry.ts().seconds();
  record.position.ordinal = entry.ts().ordinal();
  record.history_id = entry.h();
  record.version = entry.v();
  record.operation = operationFromCode(entry.op());
  record.ns = entry.ns();
  record.object = entry.o();
  record.selector = entry.o2();
  return record;
}

oplog::v1::TailRequest tailRequestFromFilter(const ChangeFilter& filter) {
  oplog::v1::TailRequest request;
  request.mutable_after()->set_seconds(filter.after.seconds);
  request.mutable_after()->set_ordinal(filter.after.ordinal);
  request.set_inclusive(filter.inclusive);
  request.set_ns(filter.ns);
  for (const OperationKind kind : filter.operations) {
    request.add_ops(operationCode(kind));
  }
  return request;
}

RawSeries rawFromProto(const metrics::v1::RawSeries& raw) {
  RawSeries series;
  series.id = raw.id();
  series.key = raw.key();
  series.at = raw.at();
  series.values.reserve(raw.values_size());
  for (const auto& datapoint : raw.values()) {
    series.values.push_back(Datapoint{datapoint.at(), datapoint.value()});
  }
  return series;
}

metrics::v1::Summary summaryToProto(const Summary& summary) {
  metrics::v1::Summary proto;
  proto.set_key(summary.key);
  proto.set_at(summary.at);
  proto.set_min(summary.min);
  proto.set_max(summary.max);
  proto.set_p2(summary.p2);
  proto.set_p9(summary.p9);
  proto.set_p25(summary.p25);
  proto.set_p50(summary.p50);
  proto.set_p75(summary.p75);
  proto.set_p91(summary.p91);
  proto.set_p98(summary.p98);
  return proto;
}

GrpcChangeSource::GrpcChangeSource(const std::shared_ptr<grpc::Channel>& channel, int rpc_timeout_seconds)
    : stub_(oplog::v1::ReplicationLogService::NewStub(channel)), rpc_timeout_seconds_(rpc_timeout_seconds) {}

LookupResult GrpcChangeSource::latest(ChangeRecord& out, std::string& error) {
  oplog::v1::LatestEntryRequest request;
  oplog::v1::OplogEntry entry;
  grpc::ClientContext context;
  setDeadline(context, rpc_timeout_seconds_);

  const grpc::Status status = stub_->LatestEntry(&context, request, &entry);
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return LookupResult::kNotFound;
  }
  if (!status.ok()) {
    error = "LatestEntry failed: " + statusText(status);
    return LookupResult::kFailed;
  }
  out = recordFromEntry(entry);
  return LookupResult::kFound;
}

std::unique_ptr<ChangeCursor> GrpcChangeSource::subscribe(const ChangeFilter& filter) {
  return std::make_unique<GrpcChangeCursor>(*stub_, tailRequestFromFilter(filter));
}

GrpcMetricsStore::GrpcMetricsStore(const std::shared_ptr<grpc::Channel>& channel, int rpc_timeout_seconds)
    : stub_(metrics::v1::MetricsStoreService::NewStub(channel)), rpc_timeout_seconds_(rpc_timeout_seconds) {}

LookupResult GrpcMetricsStore::findRaw(const std::string& id, RawSeries& out, std::string& error) {
  metrics::v1::FindRawRequest request;
  request.set_id(id);
  metrics::v1::RawSeries response;
  grpc::ClientContext context;
  setDeadline(context, rpc_timeout_seconds_);

  const grpc::Status status = stub_->FindRaw(&context, request, &response);
  if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
    return LookupResult::kNotFound;
  }
  if (!status.ok()) {
    error = "FindRaw failed: " + statusText(status);
    return LookupResult::kFailed;
  }
  out = rawFromProto(response);
  return LookupResult::kFound;
}

bool GrpcMetricsStore::upsertSummary(const Summary& summary, std::string& error) {
  metrics::v1::UpsertSummaryRequest request;
  *request.mutable_summary() = summaryToProto(summary);
  metrics::v1::UpsertSummaryResponse response;
  grpc::ClientContext context;
  setDeadline(context, rpc_timeout_seconds_);

  const grpc::Status status = stub_->UpsertSummary(&context, request, &response);
  if (!status.ok()) {
    error = "UpsertSummary failed: " + statusText(status);
    return false;
  }
  return true;
}

} // namespace oplogstats
