#include <gtest/gtest.h>

#include <cstdint>
#include <string>

#include "cascade/common/error.hpp"
#include "cascade/signal/value_type.hpp"

namespace cascade {
namespace {

TEST(ValueTypeTest, AnyAcceptsEverything) {
  auto type = ValueType<int64_t>::Any();
  EXPECT_EQ(type.Name(), "any");
  EXPECT_TRUE(type.Accepts(0));
  EXPECT_TRUE(type.Accepts(-42));
  EXPECT_NO_THROW(type.Check(7, "x"));
}

TEST(ValueTypeTest, WherePredicate) {
  auto even = ValueType<int>::Where("even", [](const int& v) {
    return v % 2 == 0;
  });
  EXPECT_EQ(even.Name(), "even");
  EXPECT_TRUE(even.Accepts(4));
  EXPECT_FALSE(even.Accepts(5));
}

TEST(ValueTypeTest, InRangeIsClosed) {
  auto percent = ValueType<double>::InRange("percent", 0.0, 100.0);
  EXPECT_TRUE(percent.Accepts(0.0));
  EXPECT_TRUE(percent.Accepts(100.0));
  EXPECT_FALSE(percent.Accepts(-0.5));
  EXPECT_FALSE(percent.Accepts(100.5));
}

TEST(ValueTypeTest, CheckThrowsTypeMismatchNamingSignalAndType) {
  auto non_empty = ValueType<std::string>::Where(
      "non-empty string", [](const std::string& s) { return !s.empty(); });

  try {
    non_empty.Check("", "title");
    FAIL() << "expected TypeMismatch";
  } catch (const TypeMismatch& e) {
    EXPECT_EQ(e.Signal(), "title");
    EXPECT_EQ(e.ExpectedType(), "non-empty string");
    EXPECT_NE(std::string(e.what()).find("non-empty string"), std::string::npos);
  }
}

}  // namespace
}  // namespace cascade
