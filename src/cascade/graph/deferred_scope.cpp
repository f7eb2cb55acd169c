#include "cascade/graph/deferred_scope.hpp"

#include <exception>

#include "cascade/graph/graph.hpp"

namespace cascade {

DeferredScope::DeferredScope(Graph& graph)
    : graph_(graph), uncaught_at_entry_(std::uncaught_exceptions()) {
  graph_.EnterDeferred();
}

DeferredScope::~DeferredScope() noexcept(false) {
  if (!open_) {
    return;
  }
  open_ = false;
  if (std::uncaught_exceptions() > uncaught_at_entry_) {
    graph_.ExitDeferredUnwinding();
    return;
  }
  graph_.ExitDeferred();
}

void DeferredScope::Close() {
  if (!open_) {
    return;
  }
  open_ = false;
  graph_.ExitDeferred();
}

}  // namespace cascade
