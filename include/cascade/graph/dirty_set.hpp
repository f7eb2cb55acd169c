#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "cascade/signal/node.hpp"

namespace cascade {

// Sparse record of signal functions marked dirty since the last flush, with
// O(1) dedup by SignalId.
//
// Entries are weak: recording a node never extends its lifetime. Entries
// whose node was collected, or was cleaned by a pull or an eager wave, are
// dropped by Take(). Not synchronized; the graph calls it under its lock.
class DirtySet {
 public:
  DirtySet() = default;

  // No-op if the node is already recorded.
  void Insert(const std::shared_ptr<SignalNode>& node);

  // Removes every entry and returns the live ones in flush order: ascending
  // rank, ties broken by ascending id (creation order). Every dependency of
  // a node precedes it.
  [[nodiscard]] auto Take() -> std::vector<std::shared_ptr<SignalNode>>;

  // Recorded entries, including stale ones not yet dropped.
  [[nodiscard]] auto Size() const -> size_t {
    return entries_.size();
  }

  [[nodiscard]] auto IsEmpty() const -> bool {
    return entries_.empty();
  }

  // Live recorded nodes, unordered. Does not remove anything.
  [[nodiscard]] auto Live() const -> std::vector<std::shared_ptr<SignalNode>>;

  void Clear();

 private:
  std::vector<std::weak_ptr<SignalNode>> entries_;
  absl::flat_hash_set<SignalId> seen_;
};

}  // namespace cascade
