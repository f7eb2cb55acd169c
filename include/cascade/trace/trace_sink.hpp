#pragma once

#include "cascade/trace/trace_event.hpp"

namespace cascade::trace {

class TraceSink {
 public:
  virtual ~TraceSink() = default;
  virtual void OnEvent(const TraceEvent& event) = 0;
};

}  // namespace cascade::trace
