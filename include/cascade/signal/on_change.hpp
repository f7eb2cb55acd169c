#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include <fmt/core.h>

#include "cascade/graph/graph.hpp"
#include "cascade/signal/bindings.hpp"
#include "cascade/signal/signal.hpp"
#include "cascade/signal/typed_node.hpp"
#include "cascade/signal/value_type.hpp"

namespace cascade {

template <typename T>
using EqualityTest = std::function<bool(const T&, const T&)>;

// Recorded half of an on-change signal: the last distinct source value.
//
// Written only by its updater function, through Record(), and registered as
// the updater's dependent so that a deferred write to the source marks it
// and its dependents. Settling it pulls the updater; that recompute calls
// Record(), so Evaluate() itself has nothing to store.
//
// Ownership runs one way: this node holds the updater as a dependency, the
// updater reaches this node through a weak_ptr. Dropping the last handle
// therefore collects both.
template <typename T>
class ChangeNode : public TypedNode<T> {
 public:
  ChangeNode(
      Graph& graph, SignalId id, uint32_t rank, std::string documentation,
      std::shared_ptr<TypedNode<T>> updater, T initial, ValueType<T> type,
      EqualityTest<T> equal)
      : TypedNode<T>(
            graph, id, SignalKind::kVariable, rank, std::move(documentation),
            {Dependency{.name = "updater", .source = std::move(updater)}},
            std::move(initial), std::move(type)),
        equal_(std::move(equal)) {
  }

  // Stores `next` and notifies dependents unless it equals the recorded
  // value. Called by the updater's compute step with the graph lock held;
  // the updater has already validated `next`.
  void Record(const T& next) {
    if (equal_(this->Stored(), next)) {
      return;
    }
    this->Store(next);
    this->NotifyChanged();
  }

 private:
  auto Evaluate() -> bool override {
    return false;
  }

  EqualityTest<T> equal_;
};

// Signal that follows `source` but only changes, and only notifies its
// dependents, when the source's value differs from the last recorded one
// under `equal`.
template <typename T>
auto OnChange(
    const Signal<T>& source,
    std::type_identity_t<EqualityTest<T>> equal = std::equal_to<T>{},
    std::string documentation = {}) -> Signal<T> {
  auto& source_node = *source.Node();
  Graph& graph = source_node.GetGraph();
  auto lock = graph.Lock();

  // Filled in once the recorded node exists.
  auto target = std::make_shared<std::weak_ptr<ChangeNode<T>>>();
  auto updater = graph.MakeFunction<T>(
      {Bind("source", source)},
      [target](const Bindings& bindings) -> T {
        T next = bindings.Get<T>(0);
        if (auto latest = target->lock()) {
          latest->Record(next);
        }
        return next;
      },
      source_node.Type(),
      fmt::format("on-change updater of {}", source_node.Label()));

  // Ranked after the updater, so an eager wave recomputes the updater before
  // anything reading this signal.
  const auto& updater_node = updater.Node();
  auto latest = std::make_shared<ChangeNode<T>>(
      graph, graph.AllocateId(), updater_node->Rank() + 1,
      std::move(documentation), updater_node, updater.Read(),
      source_node.Type(), std::move(equal));
  graph.Attach(latest);
  *target = latest;
  return Signal<T>(std::move(latest));
}

}  // namespace cascade
