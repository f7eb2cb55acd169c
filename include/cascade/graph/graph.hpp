#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "cascade/config/graph_config.hpp"
#include "cascade/graph/dirty_set.hpp"
#include "cascade/signal/function.hpp"
#include "cascade/signal/node.hpp"
#include "cascade/signal/signal.hpp"
#include "cascade/signal/value_type.hpp"
#include "cascade/signal/variable.hpp"
#include "cascade/trace/trace_manager.hpp"

namespace cascade {

struct GraphStats {
  size_t live_signals = 0;
  uint64_t recomputes = 0;
  uint64_t dirty_marks = 0;
  uint64_t waves = 0;
  uint64_t flushes = 0;
};

// Signal dependency graph and propagation engine.
//
// Propagation policy is chosen per thread:
// - Eager (no deferred scope open on the calling thread): a change starts a
//   wave that recomputes every affected function in (rank, id) order, each
//   at most once.
// - Deferred (EnterDeferred() without matching ExitDeferred()): dependents
//   are marked dirty and recorded; they are recomputed when read, or by the
//   flush that runs when the thread's outermost scope exits.
//   Direct dependents of a change are confirmed dirty; nodes reached only
//   transitively are tentative and settle without recomputing when none of
//   their inputs produced a new value.
//
// One recursive mutex guards all edges, values and dirty flags. Compute
// steps run with it held and may read other signals of the same graph.
//
// The graph must outlive every signal created from it.
class Graph {
 public:
  explicit Graph(GraphConfig config = {});
  ~Graph();

  // Non-copyable/movable: nodes refer back to the graph by reference.
  Graph(const Graph&) = delete;
  auto operator=(const Graph&) -> Graph& = delete;
  Graph(Graph&&) = delete;
  auto operator=(Graph&&) -> Graph& = delete;

  // Throws TypeMismatch if `initial` violates `type`; no node is created.
  template <typename T>
  auto MakeVariable(
      T initial,
      std::type_identity_t<ValueType<T>> type = ValueType<T>::Any(),
      std::string documentation = {}) -> Var<T> {
    auto lock = Lock();
    SignalId id = AllocateId();
    type.Check(initial, LabelFor(id, documentation));
    auto node = std::make_shared<VariableNode<T>>(
        *this, id, 0, std::move(documentation), std::move(initial),
        std::move(type));
    return Var<T>(std::move(node));
  }

  // Evaluates `compute` once, validates the result, then registers the new
  // function as a dependent of each dependency. Throws BindingError,
  // TypeMismatch or ComputeFailure before any edge is created.
  template <typename T>
  auto MakeFunction(
      std::vector<Dependency> dependencies,
      std::type_identity_t<ComputeStep<T>> compute,
      std::type_identity_t<ValueType<T>> type = ValueType<T>::Any(),
      std::string documentation = {}) -> Signal<T> {
    auto lock = Lock();
    ValidateDependencies(dependencies);
    SignalId id = AllocateId();
    T initial = FunctionNode<T>::Compute(
        dependencies, compute, type, LabelFor(id, documentation));
    uint32_t rank = RankAbove(dependencies);
    auto node = std::make_shared<FunctionNode<T>>(
        *this, id, rank, std::move(documentation), std::move(dependencies),
        std::move(compute), std::move(type), std::move(initial));
    Link(node);
    return Signal<T>(std::move(node));
  }

  // Registers a node built outside MakeVariable/MakeFunction (see OnChange):
  // validates its dependencies and adds it to their dependent lists. The
  // node's id must come from AllocateId(). Throws BindingError.
  void Attach(const std::shared_ptr<SignalNode>& node);

  // Pushes a deferred-scope marker for the calling thread.
  void EnterDeferred();

  // Pops the calling thread's marker. Popping the outermost one flushes the
  // graph. Throws ScopeError if the thread has no open scope; flush errors
  // propagate after the marker is gone.
  void ExitDeferred();

  // ExitDeferred() for use while another exception is propagating: a flush
  // failure is logged instead of thrown.
  void ExitDeferredUnwinding() noexcept;

  // Runs `body` inside a deferred scope. The flush runs even if `body`
  // throws, in which case the body's exception is the one propagated.
  template <typename Fn>
  void Deferred(Fn&& body) {
    EnterDeferred();
    try {
      std::forward<Fn>(body)();
    } catch (...) {
      ExitDeferredUnwinding();
      throw;
    }
    ExitDeferred();
  }

  // Deferred-scope depth of the calling thread.
  [[nodiscard]] auto DeferredDepth() const -> uint32_t;

  // Recomputes every live dirty function in (rank, id) order until none is
  // left. Runs automatically at outermost scope exit.
  void Flush();

  // Live dirty functions.
  [[nodiscard]] auto DirtyCount() const -> size_t;

  [[nodiscard]] auto Stats() const -> GraphStats;

  [[nodiscard]] auto GetConfig() const -> const GraphConfig& {
    return config_;
  }

  // Caller must hold Lock() while inspecting or clearing events.
  [[nodiscard]] auto GetTraceManager() -> trace::TraceManager& {
    return trace_manager_;
  }

  [[nodiscard]] auto Lock() const -> std::unique_lock<std::recursive_mutex> {
    return std::unique_lock<std::recursive_mutex>(mutex_);
  }

  // Reserves the next SignalId. For node factories outside the graph (see
  // OnChange); caller holds Lock().
  [[nodiscard]] auto AllocateId() -> SignalId {
    return next_id_++;
  }

 private:
  friend class SignalNode;

  struct Wave;

  // Node lifecycle hooks (called from SignalNode).
  void OnCreated(SignalNode& node);
  void OnReleased(SignalNode& node);
  void OnValueChanged(SignalNode& node);

  // Pull path: refreshes the node's inputs, then cleans a tentative node
  // whose inputs did not change or recomputes it.
  void Settle(SignalNode& node);
  void RefreshDependencies(SignalNode& node);
  void Recompute(SignalNode& node);

  void ValidateDependencies(const std::vector<Dependency>& dependencies) const;
  [[nodiscard]] static auto RankAbove(
      const std::vector<Dependency>& dependencies) -> uint32_t;
  [[nodiscard]] static auto LabelFor(
      SignalId id, std::string_view documentation) -> std::string;
  void Link(const std::shared_ptr<SignalNode>& node);

  void Propagate(SignalNode& node);
  void RunWave(std::vector<std::shared_ptr<SignalNode>> roots);
  void Enqueue(Wave& wave, std::shared_ptr<SignalNode> node);

  // Marks `node` dirty, tentative unless `confirmed`, and its transitive
  // dependents tentatively dirty, stopping at nodes that already are. A
  // confirmed mark on a tentative node makes it definite.
  void MarkDirty(const std::shared_ptr<SignalNode>& node, bool confirmed);
  void SetDirty(SignalNode& node, bool tentative);

  // Marks a node whose recompute failed as definitely dirty, and its
  // dependents tentatively dirty.
  void MarkFailed(SignalNode& node);

  [[nodiscard]] auto MarkingOnThisThread() const -> bool;

  GraphConfig config_;
  mutable std::recursive_mutex mutex_;

  SignalId next_id_ = 0;
  DirtySet dirty_set_;

  // Deferred-scope depth per thread. Threads without an open scope have no
  // entry.
  absl::flat_hash_map<std::thread::id, uint32_t, std::hash<std::thread::id>>
      scope_depths_;

  // Set while a wave or a flush runs; both happen with mutex_ held, so only
  // the owning thread observes them.
  Wave* active_wave_ = nullptr;
  bool flushing_ = false;
  uint64_t wave_epoch_ = 0;

  GraphStats stats_;
  trace::TraceManager trace_manager_;
};

}  // namespace cascade
