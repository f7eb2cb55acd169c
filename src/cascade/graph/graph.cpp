#include "cascade/graph/graph.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "absl/container/flat_hash_set.h"
#include "cascade/common/error.hpp"
#include "cascade/signal/node.hpp"

namespace cascade {

namespace {

// Min-heap order on (rank, id): lower ranks first, creation order among
// equal ranks.
struct LaterInWave {
  auto operator()(
      const std::shared_ptr<SignalNode>& a,
      const std::shared_ptr<SignalNode>& b) const -> bool {
    if (a->Rank() != b->Rank()) {
      return a->Rank() > b->Rank();
    }
    return a->Id() > b->Id();
  }
};

// RAII guard: holds `slot` at `value` for its lifetime, then restores the
// previous value.
template <typename T>
class ValueGuard {
 public:
  ValueGuard(T& slot, T value) : slot_(slot), saved_(slot) {
    slot_ = value;
  }
  ~ValueGuard() {
    slot_ = saved_;
  }

  ValueGuard(const ValueGuard&) = delete;
  ValueGuard(ValueGuard&&) = delete;
  auto operator=(const ValueGuard&) -> ValueGuard& = delete;
  auto operator=(ValueGuard&&) -> ValueGuard& = delete;

 private:
  T& slot_;
  T saved_;
};

}  // namespace

struct Graph::Wave {
  uint64_t epoch = 0;
  std::priority_queue<
      std::shared_ptr<SignalNode>, std::vector<std::shared_ptr<SignalNode>>,
      LaterInWave>
      queue;
};

Graph::Graph(GraphConfig config) : config_(std::move(config)) {
  trace_manager_.SetEnabled(config_.trace);
}

Graph::~Graph() {
  if (stats_.live_signals != 0) {
    spdlog::error(
        "cascade: graph destroyed with {} live signals", stats_.live_signals);
  }
}

void Graph::Attach(const std::shared_ptr<SignalNode>& node) {
  auto lock = Lock();
  ValidateDependencies(node->dependencies_);
  Link(node);
}

void Graph::EnterDeferred() {
  auto lock = Lock();
  ++scope_depths_[std::this_thread::get_id()];
}

void Graph::ExitDeferred() {
  auto lock = Lock();
  auto it = scope_depths_.find(std::this_thread::get_id());
  if (it == scope_depths_.end()) {
    throw ScopeError("exit without a matching enter on this thread");
  }
  if (--it->second > 0) {
    return;
  }
  scope_depths_.erase(it);
  Flush();
}

void Graph::ExitDeferredUnwinding() noexcept {
  try {
    ExitDeferred();
  } catch (const std::exception& e) {
    spdlog::error(
        "cascade: deferred scope exit failed during unwinding: {}", e.what());
  }
}

auto Graph::DeferredDepth() const -> uint32_t {
  auto lock = Lock();
  auto it = scope_depths_.find(std::this_thread::get_id());
  return it == scope_depths_.end() ? 0 : it->second;
}

void Graph::Flush() {
  auto lock = Lock();
  // A compute step running inside a flush cannot start another one.
  if (flushing_) {
    return;
  }
  ValueGuard<bool> flushing_guard(flushing_, true);

  size_t dirty_count = DirtyCount();
  spdlog::debug("cascade: flushing {} dirty signals", dirty_count);
  trace_manager_.EmitFlushBegin(dirty_count);

  size_t passes = 0;
  while (!dirty_set_.IsEmpty()) {
    if (passes == config_.max_flush_passes) {
      throw Error(
          fmt::format(
              "flush did not settle after {} passes; a compute step keeps "
              "writing upstream variables",
              passes));
    }
    ++passes;

    auto batch = dirty_set_.Take();
    for (size_t i = 0; i < batch.size(); ++i) {
      try {
        Settle(*batch[i]);
      } catch (...) {
        // Keep the rest of the pass recorded for the next flush or read.
        for (size_t j = i + 1; j < batch.size(); ++j) {
          if (batch[j]->dirty_) {
            dirty_set_.Insert(batch[j]);
          }
        }
        throw;
      }
    }
  }

  ++stats_.flushes;
  trace_manager_.EmitFlushEnd(passes);
  spdlog::debug("cascade: flush settled after {} passes", passes);
}

auto Graph::DirtyCount() const -> size_t {
  auto lock = Lock();
  size_t count = 0;
  for (const auto& node : dirty_set_.Live()) {
    if (node->dirty_) {
      ++count;
    }
  }
  return count;
}

auto Graph::Stats() const -> GraphStats {
  auto lock = Lock();
  return stats_;
}

void Graph::OnCreated(SignalNode& node) {
  auto lock = Lock();
  ++stats_.live_signals;
  trace_manager_.EmitSignalCreated(node.Id(), node.Rank());
}

void Graph::OnReleased(SignalNode& node) {
  auto lock = Lock();
  // The node's weak_ptrs are already expired; pruning drops them.
  for (const auto& dependency : node.dependencies_) {
    dependency.source->PruneDependents();
  }
  --stats_.live_signals;
  trace_manager_.EmitSignalReleased(node.Id());
}

void Graph::OnValueChanged(SignalNode& node) {
  trace_manager_.EmitValueChange(node.Id());
  Propagate(node);
}

void Graph::Settle(SignalNode& node) {
  if (!node.dirty_) {
    return;
  }
  // An input that recomputes either confirms this node or, outside a
  // deferred scope, recomputes it in its own wave.
  RefreshDependencies(node);
  if (!node.dirty_) {
    return;
  }
  if (node.tentative_) {
    node.dirty_ = false;
    node.tentative_ = false;
    spdlog::trace("cascade: '{}' settled without recompute", node.Label());
    return;
  }
  Recompute(node);
}

void Graph::RefreshDependencies(SignalNode& node) {
  for (const auto& dependency : node.dependencies_) {
    dependency.source->Refresh();
  }
}

void Graph::Recompute(SignalNode& node) {
  // Cleared up front: a pull of this node from inside its own evaluation
  // sees it clean, and a mark made meanwhile survives the evaluation.
  node.dirty_ = false;
  node.tentative_ = false;
  bool changed = false;
  try {
    RefreshDependencies(node);
    changed = node.Evaluate();
  } catch (...) {
    MarkFailed(node);
    throw;
  }
  if (!changed) {
    return;
  }
  ++stats_.recomputes;
  trace_manager_.EmitRecompute(node.Id());
  OnValueChanged(node);
}

void Graph::ValidateDependencies(
    const std::vector<Dependency>& dependencies) const {
  absl::flat_hash_set<std::string_view> names;
  for (const auto& dependency : dependencies) {
    if (dependency.name.empty()) {
      throw BindingError("dependency with an empty binding name");
    }
    if (dependency.source == nullptr) {
      throw BindingError(
          fmt::format("binding '{}' has no source signal", dependency.name));
    }
    if (&dependency.source->GetGraph() != this) {
      throw BindingError(
          fmt::format(
              "binding '{}' refers to a signal of another graph",
              dependency.name));
    }
    if (!names.insert(dependency.name).second) {
      throw BindingError(
          fmt::format("duplicate binding name '{}'", dependency.name));
    }
  }
}

auto Graph::RankAbove(const std::vector<Dependency>& dependencies)
    -> uint32_t {
  uint32_t rank = 0;
  for (const auto& dependency : dependencies) {
    rank = std::max(rank, dependency.source->Rank());
  }
  return rank + 1;
}

auto Graph::LabelFor(SignalId id, std::string_view documentation)
    -> std::string {
  if (!documentation.empty()) {
    return std::string(documentation);
  }
  return fmt::format("signal#{}", id);
}

void Graph::Link(const std::shared_ptr<SignalNode>& node) {
  for (const auto& dependency : node->dependencies_) {
    dependency.source->dependents_.emplace_back(node);
  }
}

void Graph::Propagate(SignalNode& node) {
  auto dependents = node.LiveDependents();
  if (dependents.empty()) {
    return;
  }

  if (MarkingOnThisThread()) {
    for (const auto& dependent : dependents) {
      MarkDirty(dependent, true);
    }
    return;
  }

  // Writes made by compute steps join the running wave.
  if (active_wave_ != nullptr) {
    for (auto& dependent : dependents) {
      Enqueue(*active_wave_, std::move(dependent));
    }
    return;
  }

  RunWave(std::move(dependents));
}

void Graph::RunWave(std::vector<std::shared_ptr<SignalNode>> roots) {
  Wave wave{.epoch = ++wave_epoch_};
  for (auto& root : roots) {
    Enqueue(wave, std::move(root));
  }
  ++stats_.waves;

  ValueGuard<Wave*> wave_guard(active_wave_, &wave);

  while (!wave.queue.empty()) {
    auto node = wave.queue.top();
    wave.queue.pop();
    try {
      Recompute(*node);
    } catch (...) {
      // Functions the wave did not reach keep their previous value and stay
      // stale.
      while (!wave.queue.empty()) {
        MarkDirty(wave.queue.top(), true);
        wave.queue.pop();
      }
      spdlog::debug(
          "cascade: wave aborted at '{}', remaining dependents marked dirty",
          node->Label());
      throw;
    }
  }
}

void Graph::Enqueue(Wave& wave, std::shared_ptr<SignalNode> node) {
  if (node->wave_epoch_ == wave.epoch) {
    return;
  }
  node->wave_epoch_ = wave.epoch;
  wave.queue.push(std::move(node));
}

void Graph::MarkDirty(
    const std::shared_ptr<SignalNode>& node, bool confirmed) {
  if (node->dirty_) {
    if (confirmed) {
      node->tentative_ = false;
    }
    return;
  }
  SetDirty(*node, !confirmed);

  std::vector<std::shared_ptr<SignalNode>> stack = node->LiveDependents();
  while (!stack.empty()) {
    auto current = std::move(stack.back());
    stack.pop_back();
    if (current->dirty_) {
      continue;
    }
    SetDirty(*current, true);
    for (auto& dependent : current->LiveDependents()) {
      stack.push_back(std::move(dependent));
    }
  }
}

void Graph::SetDirty(SignalNode& node, bool tentative) {
  node.dirty_ = true;
  node.tentative_ = tentative;
  dirty_set_.Insert(node.shared_from_this());
  ++stats_.dirty_marks;
  trace_manager_.EmitMarkDirty(node.Id());
  spdlog::trace(
      "cascade: marked '{}' dirty{}", node.Label(),
      tentative ? " (tentative)" : "");
}

void Graph::MarkFailed(SignalNode& node) {
  if (!node.dirty_) {
    ++stats_.dirty_marks;
    trace_manager_.EmitMarkDirty(node.Id());
  }
  node.dirty_ = true;
  node.tentative_ = false;
  dirty_set_.Insert(node.shared_from_this());
  for (const auto& dependent : node.LiveDependents()) {
    MarkDirty(dependent, false);
  }
}

auto Graph::MarkingOnThisThread() const -> bool {
  return flushing_ || scope_depths_.contains(std::this_thread::get_id());
}

}  // namespace cascade
