#pragma once

#include <memory>
#include <string>
#include <utility>

#include "cascade/signal/node.hpp"
#include "cascade/signal/typed_node.hpp"
#include "cascade/signal/variable.hpp"

namespace cascade {

// Read-only handle to a signal. Copies share the node; the node lives as
// long as some handle, or some dependent function, refers to it.
template <typename T>
class Signal {
 public:
  Signal() = default;
  explicit Signal(std::shared_ptr<TypedNode<T>> node)
      : node_(std::move(node)) {
  }

  [[nodiscard]] auto Read() const -> T {
    return node_->Read();
  }

  [[nodiscard]] auto Node() const -> const std::shared_ptr<TypedNode<T>>& {
    return node_;
  }

  [[nodiscard]] auto Id() const -> SignalId {
    return node_->Id();
  }

  [[nodiscard]] auto IsDirty() const -> bool {
    return node_->IsDirty();
  }

  explicit operator bool() const {
    return node_ != nullptr;
  }

 private:
  std::shared_ptr<TypedNode<T>> node_;
};

// Writable handle to a signal variable.
template <typename T>
class Var : public Signal<T> {
 public:
  Var() = default;
  explicit Var(std::shared_ptr<VariableNode<T>> node)
      : Signal<T>(node), variable_(std::move(node)) {
  }

  // Returns the written value.
  auto Write(T value) const -> T {
    return variable_->Write(std::move(value));
  }

 private:
  std::shared_ptr<VariableNode<T>> variable_;
};

// Dependency entry binding `signal` under `name`.
template <typename T>
auto Bind(std::string name, const Signal<T>& signal) -> Dependency {
  return Dependency{.name = std::move(name), .source = signal.Node()};
}

}  // namespace cascade
