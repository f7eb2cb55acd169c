#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "cascade/signal/node.hpp"
#include "cascade/signal/value_type.hpp"

namespace cascade {

// Signal node storing a value of type T under a declared ValueType<T>.
template <typename T>
class TypedNode : public SignalNode {
 public:
  using ValueTypeT = T;

  TypedNode(
      Graph& graph, SignalId id, SignalKind kind, uint32_t rank,
      std::string documentation, std::vector<Dependency> dependencies,
      T initial, ValueType<T> type)
      : SignalNode(
            graph, id, kind, rank, std::move(documentation),
            std::move(dependencies)),
        value_(std::move(initial)),
        type_(std::move(type)) {
  }

  // Current value, recomputed first if stale. The copy is taken under the
  // graph lock, so it never mixes two propagation waves.
  [[nodiscard]] auto Read() -> T {
    auto lock = LockGraph();
    Refresh();
    return value_;
  }

  [[nodiscard]] auto Type() const -> const ValueType<T>& {
    return type_;
  }

 protected:
  // Caller holds the graph lock and has validated `value`.
  void Store(T value) {
    value_ = std::move(value);
  }

  // Stored value without pulling. Caller holds the graph lock.
  [[nodiscard]] auto Stored() const -> const T& {
    return value_;
  }

 private:
  T value_;
  ValueType<T> type_;
};

}  // namespace cascade
