#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "cascade/cascade.hpp"

namespace cascade {
namespace {

class DeferredScopeTest : public ::testing::Test {
 protected:
  Graph graph_{GraphConfig{.trace = true}};

  // x -> y = x + 1, with a run counter on y.
  void MakeIncrement() {
    x_ = graph_.MakeVariable<int>(0, ValueType<int>::Any(), "x");
    y_ = graph_.MakeFunction<int>(
        {Bind("x", x_)},
        [this](const Bindings& b) {
          ++y_runs_;
          return b.Get<int>("x") + 1;
        },
        ValueType<int>::Any(), "y");
    y_runs_ = 0;
  }

  Var<int> x_;
  Signal<int> y_;
  int y_runs_ = 0;
};

TEST_F(DeferredScopeTest, WritesInsideScopeDoNotRecompute) {
  MakeIncrement();
  {
    DeferredScope scope(graph_);
    EXPECT_EQ(graph_.DeferredDepth(), 1U);
    for (int i = 1; i <= 10; ++i) {
      x_.Write(i);
    }
    EXPECT_EQ(y_runs_, 0);
    EXPECT_TRUE(y_.IsDirty());
  }
  EXPECT_EQ(graph_.DeferredDepth(), 0U);
  EXPECT_EQ(y_runs_, 1);
  EXPECT_FALSE(y_.IsDirty());
  EXPECT_EQ(y_.Read(), 11);
}

TEST_F(DeferredScopeTest, ReadInsideScopePullsLatestValue) {
  MakeIncrement();
  {
    DeferredScope scope(graph_);
    x_.Write(7);
    EXPECT_EQ(y_.Read(), 8);
    EXPECT_EQ(y_runs_, 1);
    EXPECT_FALSE(y_.IsDirty());
  }
  // Nothing left to flush.
  EXPECT_EQ(y_runs_, 1);
}

TEST_F(DeferredScopeTest, TwoWrittenDependenciesRecomputeOnce) {
  auto a = graph_.MakeVariable<int>(1);
  auto b = graph_.MakeVariable<int>(2);
  int runs = 0;
  auto sum = graph_.MakeFunction<int>(
      {Bind("a", a), Bind("b", b)}, [&runs](const Bindings& in) {
        ++runs;
        return in.Get<int>("a") + in.Get<int>("b");
      });
  runs = 0;

  graph_.Deferred([&] {
    a.Write(10);
    b.Write(20);
  });

  EXPECT_EQ(runs, 1);
  EXPECT_EQ(sum.Read(), 30);
}

TEST_F(DeferredScopeTest, DirtinessPropagatesTransitively) {
  MakeIncrement();
  auto z = graph_.MakeFunction<int>(
      {Bind("y", y_)}, [](const Bindings& b) { return b.Get<int>("y") * 2; });

  DeferredScope scope(graph_);
  x_.Write(3);
  EXPECT_TRUE(y_.IsDirty());
  EXPECT_TRUE(z.IsDirty());
  EXPECT_EQ(graph_.DirtyCount(), 2U);

  // Pulling y cleans y only; z stays stale until read or flushed.
  EXPECT_EQ(y_.Read(), 4);
  EXPECT_TRUE(z.IsDirty());

  scope.Close();
  EXPECT_FALSE(scope.IsOpen());
  EXPECT_FALSE(z.IsDirty());
  EXPECT_EQ(z.Read(), 8);
}

TEST_F(DeferredScopeTest, NestedScopesFlushOnlyAtOutermostExit) {
  MakeIncrement();
  {
    DeferredScope outer(graph_);
    {
      DeferredScope inner(graph_);
      EXPECT_EQ(graph_.DeferredDepth(), 2U);
      x_.Write(1);
    }
    EXPECT_EQ(graph_.DeferredDepth(), 1U);
    EXPECT_EQ(y_runs_, 0);
    EXPECT_TRUE(y_.IsDirty());
    x_.Write(2);
  }
  EXPECT_EQ(y_runs_, 1);
  EXPECT_EQ(y_.Read(), 3);
}

TEST_F(DeferredScopeTest, FlushLeavesNoDirtyFunction) {
  auto a = graph_.MakeVariable<int>(0);
  auto b = graph_.MakeVariable<int>(0);
  auto f = graph_.MakeFunction<int>(
      {Bind("a", a)}, [](const Bindings& in) { return in.Get<int>("a") + 1; });
  auto g = graph_.MakeFunction<int>(
      {Bind("a", a), Bind("b", b)},
      [](const Bindings& in) { return in.Get<int>("a") * in.Get<int>("b"); });
  auto h = graph_.MakeFunction<int>(
      {Bind("f", f), Bind("g", g)},
      [](const Bindings& in) { return in.Get<int>("f") - in.Get<int>("g"); });

  graph_.EnterDeferred();
  a.Write(3);
  b.Write(4);
  EXPECT_EQ(graph_.DirtyCount(), 3U);
  graph_.ExitDeferred();

  EXPECT_EQ(graph_.DirtyCount(), 0U);
  EXPECT_FALSE(f.IsDirty());
  EXPECT_FALSE(g.IsDirty());
  EXPECT_FALSE(h.IsDirty());
  EXPECT_EQ(h.Read(), 4 - 12);
  EXPECT_EQ(graph_.GetTraceManager().CountRecomputes(h.Id()), 1U);
  EXPECT_EQ(graph_.Stats().flushes, 1U);
}

TEST_F(DeferredScopeTest, FlushRunsWhenBodyThrows) {
  MakeIncrement();
  EXPECT_THROW(
      graph_.Deferred([&] {
        x_.Write(41);
        throw std::runtime_error("body failed");
      }),
      std::runtime_error);

  EXPECT_EQ(graph_.DeferredDepth(), 0U);
  EXPECT_FALSE(y_.IsDirty());
  EXPECT_EQ(y_runs_, 1);
  EXPECT_EQ(y_.Read(), 42);
}

TEST_F(DeferredScopeTest, RaiiScopeFlushesDuringUnwinding) {
  MakeIncrement();
  try {
    DeferredScope scope(graph_);
    x_.Write(9);
    throw std::runtime_error("leave early");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(graph_.DeferredDepth(), 0U);
  EXPECT_FALSE(y_.IsDirty());
  EXPECT_EQ(y_.Read(), 10);
}

TEST_F(DeferredScopeTest, FlushFailurePropagatesFromClose) {
  auto x = graph_.MakeVariable<int>(0);
  auto checked = graph_.MakeFunction<int>(
      {Bind("x", x)},
      [](const Bindings& b) {
        if (b.Get<int>("x") == 13) {
          throw std::runtime_error("unlucky");
        }
        return b.Get<int>("x");
      },
      ValueType<int>::Any(), "checked");

  DeferredScope scope(graph_);
  x.Write(13);
  EXPECT_THROW(scope.Close(), ComputeFailure);
  EXPECT_EQ(graph_.DeferredDepth(), 0U);

  // Still stale; a later flush or read retries.
  EXPECT_TRUE(checked.IsDirty());
  EXPECT_EQ(graph_.DirtyCount(), 1U);
  x.Write(14);
  EXPECT_EQ(checked.Read(), 14);
}

TEST_F(DeferredScopeTest, FlushFailureDuringUnwindingKeepsBodyException) {
  auto x = graph_.MakeVariable<int>(0);
  auto checked = graph_.MakeFunction<int>(
      {Bind("x", x)}, [](const Bindings& b) {
        if (b.Get<int>("x") < 0) {
          throw std::runtime_error("negative");
        }
        return b.Get<int>("x");
      });

  EXPECT_THROW(
      graph_.Deferred([&] {
        x.Write(-1);
        throw std::logic_error("body failed");
      }),
      std::logic_error);
  EXPECT_EQ(graph_.DeferredDepth(), 0U);
  EXPECT_TRUE(checked.IsDirty());
}

TEST_F(DeferredScopeTest, UnbalancedExitThrowsScopeError) {
  EXPECT_THROW(graph_.ExitDeferred(), ScopeError);
  EXPECT_EQ(graph_.DeferredDepth(), 0U);
}

TEST_F(DeferredScopeTest, ExplicitFlushInsideOpenScope) {
  MakeIncrement();
  graph_.EnterDeferred();
  x_.Write(5);
  graph_.Flush();
  EXPECT_FALSE(y_.IsDirty());
  EXPECT_EQ(y_runs_, 1);
  // Still deferred: the next write only marks.
  x_.Write(6);
  EXPECT_TRUE(y_.IsDirty());
  graph_.ExitDeferred();
  EXPECT_EQ(y_.Read(), 7);
  EXPECT_EQ(y_runs_, 2);
}

TEST(DeferredFlushLimitTest, FlushGivesUpAfterPassLimit) {
  Graph graph{GraphConfig{.max_flush_passes = 8}};
  auto v = graph.MakeVariable<int>(0);
  auto w = graph.MakeVariable<int>(0);
  // f writes w, g writes v back: every pass dirties the other function.
  auto f = graph.MakeFunction<int>({Bind("v", v)}, [w](const Bindings& b) {
    return w.Write(b.Get<int>("v") + 1);
  });
  auto g = graph.MakeFunction<int>({Bind("w", w)}, [v](const Bindings& b) {
    return v.Write(b.Get<int>("w") + 1);
  });

  EXPECT_THROW(graph.Deferred([&] { v.Write(100); }), Error);
  EXPECT_EQ(graph.DeferredDepth(), 0U);
  EXPECT_GT(graph.DirtyCount(), 0U);
}

}  // namespace
}  // namespace cascade
