#include "cascade/common/error.hpp"

#include <string>
#include <utility>

#include <fmt/core.h>

namespace cascade {

TypeMismatch::TypeMismatch(std::string signal, std::string expected_type)
    : Error(
          fmt::format(
              "value for signal '{}' does not satisfy type '{}'", signal,
              expected_type)),
      signal_(std::move(signal)),
      expected_type_(std::move(expected_type)) {
}

ComputeFailure::ComputeFailure(std::string signal, const std::string& detail)
    : Error(
          fmt::format("compute step of signal '{}' failed: {}", signal, detail)),
      signal_(std::move(signal)) {
}

BindingError::BindingError(const std::string& detail)
    : Error(fmt::format("binding error: {}", detail)) {
}

ScopeError::ScopeError(const std::string& detail)
    : Error(fmt::format("deferred scope error: {}", detail)) {
}

}  // namespace cascade
