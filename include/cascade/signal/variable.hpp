#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "cascade/signal/typed_node.hpp"

namespace cascade {

// Signal whose value is assigned directly by outside code.
template <typename T>
class VariableNode : public TypedNode<T> {
 public:
  VariableNode(
      Graph& graph, SignalId id, uint32_t rank, std::string documentation,
      T initial, ValueType<T> type)
      : TypedNode<T>(
            graph, id, SignalKind::kVariable, rank, std::move(documentation),
            {}, std::move(initial), std::move(type)) {
  }

  // Validates, stores and propagates. A rejected value leaves the variable
  // untouched. Errors raised by dependents during propagation reach the
  // caller; the new value stays stored.
  auto Write(T value) -> T {
    auto lock = this->LockGraph();
    this->Type().Check(value, this->Label());
    this->Store(std::move(value));
    this->NotifyChanged();
    return this->Stored();
  }
};

}  // namespace cascade
