#include "cascade/signal/node.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "cascade/common/internal_error.hpp"
#include "cascade/graph/graph.hpp"

namespace cascade {

auto SignalKindName(SignalKind kind) -> std::string_view {
  switch (kind) {
    case SignalKind::kVariable:
      return "variable";
    case SignalKind::kFunction:
      return "function";
  }
  return "unknown";
}

SignalNode::SignalNode(
    Graph& graph, SignalId id, SignalKind kind, uint32_t rank,
    std::string documentation, std::vector<Dependency> dependencies)
    : graph_(graph),
      id_(id),
      kind_(kind),
      rank_(rank),
      documentation_(std::move(documentation)),
      dependencies_(std::move(dependencies)) {
  graph_.OnCreated(*this);
}

SignalNode::~SignalNode() {
  graph_.OnReleased(*this);
}

auto SignalNode::Label() const -> std::string {
  if (!documentation_.empty()) {
    return documentation_;
  }
  return fmt::format("signal#{}", id_);
}

auto SignalNode::IsDirty() const -> bool {
  auto lock = LockGraph();
  return dirty_;
}

auto SignalNode::DependentCount() const -> size_t {
  auto lock = LockGraph();
  return static_cast<size_t>(std::ranges::count_if(
      dependents_, [](const auto& weak) { return !weak.expired(); }));
}

void SignalNode::Refresh() {
  if (dirty_) {
    graph_.Settle(*this);
  }
}

auto SignalNode::LockGraph() const -> std::unique_lock<std::recursive_mutex> {
  return graph_.Lock();
}

void SignalNode::NotifyChanged() {
  graph_.OnValueChanged(*this);
}

auto SignalNode::Evaluate() -> bool {
  throw common::InternalError(
      "SignalNode::Evaluate",
      fmt::format(
          "{} '{}' has no compute step", SignalKindName(kind_), Label()));
}

auto SignalNode::LiveDependents() -> std::vector<std::shared_ptr<SignalNode>> {
  std::vector<std::shared_ptr<SignalNode>> live;
  live.reserve(dependents_.size());
  for (const auto& weak : dependents_) {
    if (auto node = weak.lock()) {
      live.push_back(std::move(node));
    }
  }
  if (live.size() != dependents_.size()) {
    PruneDependents();
  }
  return live;
}

void SignalNode::PruneDependents() {
  std::erase_if(dependents_, [](const auto& weak) { return weak.expired(); });
}

}  // namespace cascade
