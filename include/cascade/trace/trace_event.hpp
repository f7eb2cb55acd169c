#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>

namespace cascade::trace {

struct SignalCreated {
  uint32_t signal_id;
  uint32_t rank;
};

// A variable was written, or a function stored a recomputed value.
struct ValueChange {
  uint32_t signal_id;
};

// A function ran its compute step (eager wave, pull on read, or flush).
struct Recompute {
  uint32_t signal_id;
};

// A function was marked stale instead of being recomputed.
struct MarkDirty {
  uint32_t signal_id;
};

// Outermost deferred scope exit (or explicit flush) started.
// dirty_count: live dirty functions found at the start of the flush.
struct FlushBegin {
  size_t dirty_count;
};

// passes: number of rank-ordered sweeps the flush needed.
struct FlushEnd {
  size_t passes;
};

// Last handle dropped; the node left the graph.
struct SignalReleased {
  uint32_t signal_id;
};

using TraceEvent = std::variant<
    SignalCreated, ValueChange, Recompute, MarkDirty, FlushBegin, FlushEnd,
    SignalReleased>;

}  // namespace cascade::trace
