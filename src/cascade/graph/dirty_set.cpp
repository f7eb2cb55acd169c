#include "cascade/graph/dirty_set.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

namespace cascade {

void DirtySet::Insert(const std::shared_ptr<SignalNode>& node) {
  if (!seen_.insert(node->Id()).second) {
    return;
  }
  entries_.push_back(node);
}

auto DirtySet::Take() -> std::vector<std::shared_ptr<SignalNode>> {
  auto live = Live();
  Clear();
  std::ranges::sort(live, [](const auto& a, const auto& b) {
    if (a->Rank() != b->Rank()) {
      return a->Rank() < b->Rank();
    }
    return a->Id() < b->Id();
  });
  return live;
}

auto DirtySet::Live() const -> std::vector<std::shared_ptr<SignalNode>> {
  std::vector<std::shared_ptr<SignalNode>> live;
  live.reserve(entries_.size());
  for (const auto& weak : entries_) {
    if (auto node = weak.lock()) {
      live.push_back(std::move(node));
    }
  }
  return live;
}

void DirtySet::Clear() {
  entries_.clear();
  seen_.clear();
}

}  // namespace cascade
