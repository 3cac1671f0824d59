#include "halt.hpp"

#include <utility>

namespace oplogstats {

PipelineHalt::PipelineHalt(std::function<void()> teardown) : teardown_(std::move(teardown)) {}

void PipelineHalt::report(PipelineError error) {
  first_.record(std::move(error));
}

void PipelineHalt::abort(PipelineError error) {
  first_.record(std::move(error));
  std::call_once(teardown_once_, [this]() {
    if (teardown_) {
      teardown_();
    }
  });
}

std::optional<PipelineError> PipelineHalt::error() const {
  return first_.get();
}

} // namespace oplogstats
