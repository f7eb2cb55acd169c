#include "cascade/signal/bindings.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include <fmt/core.h>

#include "cascade/common/error.hpp"

namespace cascade {

auto Bindings::NameAt(size_t index) const -> std::string_view {
  return At(index).name;
}

auto Bindings::Contains(std::string_view name) const -> bool {
  return std::ranges::any_of(dependencies_, [name](const Dependency& dep) {
    return dep.name == name;
  });
}

auto Bindings::Find(std::string_view name) const -> const Dependency& {
  auto it = std::ranges::find_if(dependencies_, [name](const Dependency& dep) {
    return dep.name == name;
  });
  if (it == dependencies_.end()) {
    throw BindingError(fmt::format("no binding named '{}'", name));
  }
  return *it;
}

auto Bindings::At(size_t index) const -> const Dependency& {
  if (index >= dependencies_.size()) {
    throw BindingError(
        fmt::format(
            "binding index {} out of range (have {} bindings)", index,
            dependencies_.size()));
  }
  return dependencies_[index];
}

void Bindings::ThrowWrongType(const Dependency& dependency) {
  throw BindingError(
      fmt::format(
          "binding '{}' ({}) does not hold the requested value type",
          dependency.name, dependency.source->Label()));
}

}  // namespace cascade
