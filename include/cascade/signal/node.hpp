#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cascade {

class Graph;
class SignalNode;

// Graph-unique signal identifier, assigned in creation order.
using SignalId = uint32_t;

enum class SignalKind : uint8_t {
  kVariable = 0,
  kFunction = 1,
};

auto SignalKindName(SignalKind kind) -> std::string_view;

// One (binding-name, source-signal) pair of a signal function.
// The source is held strongly: a function keeps its inputs alive.
struct Dependency {
  std::string name;
  std::shared_ptr<SignalNode> source;
};

// Untyped part of a signal: identity, graph edges and the dirty flag.
//
// Edges are asymmetric in ownership. A function owns its dependencies
// (shared_ptr) while a signal refers to its dependents through weak_ptr, so
// depending on a signal never keeps the dependent alive. A node's destructor
// prunes it from its dependencies' dependent lists.
//
// All mutable state is guarded by the owning graph's mutex.
class SignalNode : public std::enable_shared_from_this<SignalNode> {
 public:
  SignalNode(
      Graph& graph, SignalId id, SignalKind kind, uint32_t rank,
      std::string documentation, std::vector<Dependency> dependencies);
  virtual ~SignalNode();

  // Non-copyable/movable: dependents refer to this node by address.
  SignalNode(const SignalNode&) = delete;
  auto operator=(const SignalNode&) -> SignalNode& = delete;
  SignalNode(SignalNode&&) = delete;
  auto operator=(SignalNode&&) -> SignalNode& = delete;

  [[nodiscard]] auto Id() const -> SignalId {
    return id_;
  }
  [[nodiscard]] auto Kind() const -> SignalKind {
    return kind_;
  }

  // Position in dependency order. Variables have rank 0, a function ranks
  // one above its highest-ranked dependency.
  [[nodiscard]] auto Rank() const -> uint32_t {
    return rank_;
  }
  [[nodiscard]] auto Documentation() const -> const std::string& {
    return documentation_;
  }

  // Documentation if present, "signal#<id>" otherwise. Used in messages.
  [[nodiscard]] auto Label() const -> std::string;

  [[nodiscard]] auto GetGraph() const -> Graph& {
    return graph_;
  }

  [[nodiscard]] auto Dependencies() const -> const std::vector<Dependency>& {
    return dependencies_;
  }

  [[nodiscard]] auto IsDirty() const -> bool;

  // Number of dependents still alive.
  [[nodiscard]] auto DependentCount() const -> size_t;

  // Brings the stored value up to date (pull). Caller holds the graph lock.
  void Refresh();

 protected:
  [[nodiscard]] auto LockGraph() const -> std::unique_lock<std::recursive_mutex>;

  // Reports a new stored value to the propagation engine. Caller holds the
  // graph lock.
  void NotifyChanged();

 private:
  friend class Graph;

  // Recompute step: evaluate, validate and store. Returns whether dependents
  // must be told about a new value.
  virtual auto Evaluate() -> bool;

  // Returns live dependents and drops expired ones.
  auto LiveDependents() -> std::vector<std::shared_ptr<SignalNode>>;
  void PruneDependents();

  Graph& graph_;
  SignalId id_;
  SignalKind kind_;
  uint32_t rank_;
  std::string documentation_;
  std::vector<Dependency> dependencies_;
  std::vector<std::weak_ptr<SignalNode>> dependents_;

  bool dirty_ = false;

  // Dirty only because something upstream might change. Settling a
  // tentative node whose inputs turn out unchanged skips its compute step.
  bool tentative_ = false;

  // Epoch guard: a node is queued at most once per eager wave.
  uint64_t wave_epoch_ = 0;
};

}  // namespace cascade
