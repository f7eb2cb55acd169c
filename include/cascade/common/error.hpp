#pragma once

#include <stdexcept>
#include <string>

namespace cascade {

// Base class of every error a signal operation reports to its caller.
class Error : public std::runtime_error {
 public:
  explicit Error(const std::string& message) : std::runtime_error(message) {
  }
};

// A value assigned to, or computed for, a signal does not satisfy the
// signal's declared value type.
class TypeMismatch : public Error {
 public:
  TypeMismatch(std::string signal, std::string expected_type);

  [[nodiscard]] auto Signal() const -> const std::string& {
    return signal_;
  }
  [[nodiscard]] auto ExpectedType() const -> const std::string& {
    return expected_type_;
  }

 private:
  std::string signal_;
  std::string expected_type_;
};

// The compute step of a signal function threw. The original exception is
// nested and can be recovered with std::rethrow_if_nested.
class ComputeFailure : public Error {
 public:
  ComputeFailure(std::string signal, const std::string& detail);

  [[nodiscard]] auto Signal() const -> const std::string& {
    return signal_;
  }

 private:
  std::string signal_;
};

// Malformed dependency list, or a compute step asked its bindings for a
// name or value type they do not have.
class BindingError : public Error {
 public:
  explicit BindingError(const std::string& detail);
};

// Deferred scope exit without a matching enter on the calling thread.
class ScopeError : public Error {
 public:
  explicit ScopeError(const std::string& detail);
};

}  // namespace cascade
