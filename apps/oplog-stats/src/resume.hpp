#ifndef OPLOG_STATS_RESUME_HPP
#define OPLOG_STATS_RESUME_HPP

#include "backend.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace oplogstats {

// Position of the newest record in the log. Must run before subscribing;
// the subscription then asks for records strictly after it.
bool resolveResumePosition(ChangeSource& source, OplogPosition& out, PipelineError& error);

// Filter the pipeline tails with: after `resume`, exclusive, inserts and
// updates on the raw series namespace only.
ChangeFilter pipelineFilter(const OplogPosition& resume);

} // namespace oplogstats

#endif
