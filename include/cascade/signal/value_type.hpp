#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "cascade/common/error.hpp"

namespace cascade {

// Declared value constraint of a signal. The C++ type T is checked at
// compile time; the predicate narrows it further at run time and is applied
// to every value a signal stores.
template <typename T>
class ValueType {
 public:
  using Predicate = std::function<bool(const T&)>;

  // Accepts every value of T.
  static auto Any(std::string name = "any") -> ValueType {
    return ValueType(std::move(name), nullptr);
  }

  static auto Where(std::string name, Predicate predicate) -> ValueType {
    return ValueType(std::move(name), std::move(predicate));
  }

  // Closed interval [low, high] under T's operator<.
  static auto InRange(std::string name, T low, T high) -> ValueType {
    return ValueType(
        std::move(name),
        [low = std::move(low), high = std::move(high)](const T& value) {
          return !(value < low) && !(high < value);
        });
  }

  [[nodiscard]] auto Name() const -> const std::string& {
    return name_;
  }

  [[nodiscard]] auto Accepts(const T& value) const -> bool {
    return !predicate_ || predicate_(value);
  }

  // Throws TypeMismatch naming `signal` if `value` is rejected.
  void Check(const T& value, std::string_view signal) const {
    if (!Accepts(value)) {
      throw TypeMismatch(std::string(signal), name_);
    }
  }

 private:
  ValueType(std::string name, Predicate predicate)
      : name_(std::move(name)), predicate_(std::move(predicate)) {
  }

  std::string name_;
  Predicate predicate_;
};

}  // namespace cascade
