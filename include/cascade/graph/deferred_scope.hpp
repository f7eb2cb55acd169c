#pragma once

namespace cascade {

class Graph;

// RAII deferred-update scope on the calling thread.
//
// Propagation on this thread switches to mark-dirty mode until the scope
// closes; closing the outermost scope flushes the graph. The flush also runs
// when the scope is left by an exception, in which case a flush failure is
// logged and the original exception keeps propagating. Otherwise flush
// errors are thrown from Close() or from the destructor.
//
// Must be closed on the thread that opened it.
class DeferredScope {
 public:
  explicit DeferredScope(Graph& graph);
  ~DeferredScope() noexcept(false);

  // Non-copyable, non-movable (RAII resource)
  DeferredScope(const DeferredScope&) = delete;
  DeferredScope& operator=(const DeferredScope&) = delete;
  DeferredScope(DeferredScope&&) = delete;
  DeferredScope& operator=(DeferredScope&&) = delete;

  // Exits now instead of at destruction. Idempotent.
  void Close();

  [[nodiscard]] auto IsOpen() const -> bool {
    return open_;
  }

 private:
  Graph& graph_;
  bool open_ = true;
  int uncaught_at_entry_;
};

}  // namespace cascade
