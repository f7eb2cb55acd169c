#include "cascade/trace/trace_manager.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/core.h>

#include "cascade/trace/trace_event.hpp"
#include "cascade/trace/trace_sink.hpp"

namespace cascade::trace {

namespace {

template <typename Event>
auto CountFor(const std::vector<TraceEvent>& events, uint32_t signal_id)
    -> size_t {
  size_t count = 0;
  for (const auto& event : events) {
    if (const auto* e = std::get_if<Event>(&event)) {
      if (e->signal_id == signal_id) {
        ++count;
      }
    }
  }
  return count;
}

}  // namespace

void TraceManager::AddSink(std::unique_ptr<TraceSink> sink) {
  sinks_.push_back(std::move(sink));
}

void TraceManager::EmitSignalCreated(uint32_t signal_id, uint32_t rank) {
  Record(SignalCreated{.signal_id = signal_id, .rank = rank});
}

void TraceManager::EmitValueChange(uint32_t signal_id) {
  Record(ValueChange{.signal_id = signal_id});
}

void TraceManager::EmitRecompute(uint32_t signal_id) {
  Record(Recompute{.signal_id = signal_id});
}

void TraceManager::EmitMarkDirty(uint32_t signal_id) {
  Record(MarkDirty{.signal_id = signal_id});
}

void TraceManager::EmitFlushBegin(size_t dirty_count) {
  Record(FlushBegin{.dirty_count = dirty_count});
}

void TraceManager::EmitFlushEnd(size_t passes) {
  Record(FlushEnd{.passes = passes});
}

void TraceManager::EmitSignalReleased(uint32_t signal_id) {
  Record(SignalReleased{.signal_id = signal_id});
}

auto TraceManager::Events() const -> const std::vector<TraceEvent>& {
  return events_;
}

auto TraceManager::CountRecomputes(uint32_t signal_id) const -> size_t {
  return CountFor<Recompute>(events_, signal_id);
}

auto TraceManager::CountValueChanges(uint32_t signal_id) const -> size_t {
  return CountFor<ValueChange>(events_, signal_id);
}

auto TraceManager::CountMarkDirty(uint32_t signal_id) const -> size_t {
  return CountFor<MarkDirty>(events_, signal_id);
}

auto TraceManager::CountFlushes() const -> size_t {
  size_t count = 0;
  for (const auto& event : events_) {
    if (std::holds_alternative<FlushBegin>(event)) {
      ++count;
    }
  }
  return count;
}

void TraceManager::PrintSummary() const {
  size_t value_changes = 0;
  size_t recomputes = 0;
  size_t mark_dirty = 0;
  size_t flushes = 0;

  // Per-signal counters
  struct SignalCounts {
    size_t value_changes = 0;
    size_t recomputes = 0;
    size_t mark_dirty = 0;
  };
  std::map<uint32_t, SignalCounts> signal_counts;

  for (const auto& event : events_) {
    std::visit(
        [&](const auto& e) {
          using T = std::decay_t<decltype(e)>;
          if constexpr (std::is_same_v<T, ValueChange>) {
            ++value_changes;
            signal_counts[e.signal_id].value_changes++;
          } else if constexpr (std::is_same_v<T, Recompute>) {
            ++recomputes;
            signal_counts[e.signal_id].recomputes++;
          } else if constexpr (std::is_same_v<T, MarkDirty>) {
            ++mark_dirty;
            signal_counts[e.signal_id].mark_dirty++;
          } else if constexpr (std::is_same_v<T, FlushBegin>) {
            ++flushes;
          }
        },
        event);
  }

  fmt::print(
      "__CASCADE_TRACE__: value_changes={} recomputes={} mark_dirty={} "
      "flushes={}\n",
      value_changes, recomputes, mark_dirty, flushes);

  for (const auto& [signal_id, counts] : signal_counts) {
    fmt::print(
        "__CASCADE_TRACE_SIGNAL__: signal={} value_changes={} recomputes={} "
        "mark_dirty={}\n",
        signal_id, counts.value_changes, counts.recomputes, counts.mark_dirty);
  }
}

void TraceManager::Record(TraceEvent event) {
  if (!enabled_) {
    return;
  }
  for (const auto& sink : sinks_) {
    sink->OnEvent(event);
  }
  events_.push_back(std::move(event));
}

}  // namespace cascade::trace
