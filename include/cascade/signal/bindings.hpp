#pragma once

#include <cstddef>
#include <span>
#include <string_view>

#include "cascade/signal/node.hpp"
#include "cascade/signal/typed_node.hpp"

namespace cascade {

// Read access to a signal function's dependencies, as seen by its compute
// step. Reading a binding pulls the dependency if it is dirty, so the
// compute step always sees current values.
class Bindings {
 public:
  explicit Bindings(std::span<const Dependency> dependencies)
      : dependencies_(dependencies) {
  }

  template <typename U>
  [[nodiscard]] auto Get(std::string_view name) const -> U {
    return ReadAs<U>(Find(name));
  }

  template <typename U>
  [[nodiscard]] auto Get(size_t index) const -> U {
    return ReadAs<U>(At(index));
  }

  [[nodiscard]] auto Size() const -> size_t {
    return dependencies_.size();
  }

  [[nodiscard]] auto NameAt(size_t index) const -> std::string_view;
  [[nodiscard]] auto Contains(std::string_view name) const -> bool;

 private:
  // Both throw BindingError.
  [[nodiscard]] auto Find(std::string_view name) const -> const Dependency&;
  [[nodiscard]] auto At(size_t index) const -> const Dependency&;

  template <typename U>
  static auto ReadAs(const Dependency& dependency) -> U {
    auto* typed = dynamic_cast<TypedNode<U>*>(dependency.source.get());
    if (typed == nullptr) {
      ThrowWrongType(dependency);
    }
    return typed->Read();
  }

  [[noreturn]] static void ThrowWrongType(const Dependency& dependency);

  std::span<const Dependency> dependencies_;
};

}  // namespace cascade
