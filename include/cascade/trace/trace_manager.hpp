#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "cascade/trace/trace_event.hpp"
#include "cascade/trace/trace_sink.hpp"

namespace cascade::trace {

// Records propagation events of one graph. Disabled by default; when
// disabled, Emit* calls are no-ops. Not synchronized on its own: the graph
// calls it with its lock held.
class TraceManager {
 public:
  void SetEnabled(bool enabled) {
    enabled_ = enabled;
  }
  [[nodiscard]] bool IsEnabled() const {
    return enabled_;
  }

  void AddSink(std::unique_ptr<TraceSink> sink);

  void EmitSignalCreated(uint32_t signal_id, uint32_t rank);
  void EmitValueChange(uint32_t signal_id);
  void EmitRecompute(uint32_t signal_id);
  void EmitMarkDirty(uint32_t signal_id);
  void EmitFlushBegin(size_t dirty_count);
  void EmitFlushEnd(size_t passes);
  void EmitSignalReleased(uint32_t signal_id);

  // Post-run query.
  [[nodiscard]] auto Events() const -> const std::vector<TraceEvent>&;
  [[nodiscard]] auto CountRecomputes(uint32_t signal_id) const -> size_t;
  [[nodiscard]] auto CountValueChanges(uint32_t signal_id) const -> size_t;
  [[nodiscard]] auto CountMarkDirty(uint32_t signal_id) const -> size_t;
  [[nodiscard]] auto CountFlushes() const -> size_t;

  void Clear() {
    events_.clear();
  }

  // Print summary to stdout.
  // Format: __CASCADE_TRACE__: value_changes=N recomputes=M mark_dirty=K
  // flushes=F
  // Plus per-signal lines: __CASCADE_TRACE_SIGNAL__: signal=S
  // value_changes=V recomputes=R mark_dirty=D
  void PrintSummary() const;

 private:
  void Record(TraceEvent event);

  bool enabled_ = false;
  std::vector<TraceEvent> events_;
  std::vector<std::unique_ptr<TraceSink>> sinks_;
};

}  // namespace cascade::trace
