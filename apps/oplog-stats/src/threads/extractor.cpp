#include "extractor.hpp"

#include <iostream>
#include <utility>

#include "../extract.hpp"
#include "../format.hpp"

namespace oplogstats {

void extractorThread(
  HandoffQueue<ChangeRecord>& input,
  HandoffQueue<std::string>& output,
  Metrics& metrics
) {
  ChangeRecord record;
  while (input.pop(record)) {
    auto id = extractEntityId(record);
    if (!id) {
      metrics.incrementDropped();
      std::cerr << "Dropped " << operationCode(record.operation) << " on " << record.ns << " at "
                << formatPosition(record.position) << ": no usable " << kIdField << "\n";
      continue;
    }

    metrics.incrementExtracted();
    const auto wait_start = std::chrono::steady_clock::now();
    if (!output.push(std::move(*id))) {
      break;
    }
    metrics.addHandoffWait(elapsedMs(wait_start));
  }

  output.close();
}

} // namespace oplogstats
