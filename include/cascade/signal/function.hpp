#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "cascade/common/error.hpp"
#include "cascade/signal/bindings.hpp"
#include "cascade/signal/typed_node.hpp"

namespace cascade {

template <typename T>
using ComputeStep = std::function<T(const Bindings&)>;

// Signal whose value is derived from a fixed list of dependencies.
template <typename T>
class FunctionNode : public TypedNode<T> {
 public:
  FunctionNode(
      Graph& graph, SignalId id, uint32_t rank, std::string documentation,
      std::vector<Dependency> dependencies, ComputeStep<T> compute,
      ValueType<T> type, T initial)
      : TypedNode<T>(
            graph, id, SignalKind::kFunction, rank, std::move(documentation),
            std::move(dependencies), std::move(initial), std::move(type)),
        compute_(std::move(compute)) {
  }

  // Runs `compute` over the current values of `dependencies` and validates
  // the result. Exceptions other than TypeMismatch and ComputeFailure are
  // nested into a ComputeFailure naming `label`.
  static auto Compute(
      const std::vector<Dependency>& dependencies,
      const ComputeStep<T>& compute, const ValueType<T>& type,
      std::string_view label) -> T {
    Bindings bindings(dependencies);
    auto result = [&]() -> T {
      try {
        return compute(bindings);
      } catch (const TypeMismatch&) {
        throw;
      } catch (const ComputeFailure&) {
        throw;
      } catch (const std::exception& e) {
        std::throw_with_nested(ComputeFailure(std::string(label), e.what()));
      } catch (...) {
        std::throw_with_nested(
            ComputeFailure(std::string(label), "non-standard exception"));
      }
    }();
    type.Check(result, label);
    return result;
  }

 private:
  auto Evaluate() -> bool override {
    this->Store(
        Compute(this->Dependencies(), compute_, this->Type(), this->Label()));
    return true;
  }

  ComputeStep<T> compute_;
};

}  // namespace cascade
