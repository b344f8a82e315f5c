// Repository: simcore
// Component: Immutable date and pattern snapshot tests

#include <gtest/gtest.h>

#include <memory>

#include "simcore/payload/Payload.hpp"
#include "simcore/snapshot/Snapshot.hpp"

namespace simcore::snapshot {
namespace {

using payload::Date;
using payload::Pattern;
using payload::Value;

// -----------------------------------------------------------------------------
// Date
// -----------------------------------------------------------------------------
TEST(ImmutableDateTest, ReadsFieldsAndIgnoresLaterSourceWrites) {
  auto date = std::make_shared<Date>(Date::FromUtc(2025, 5, 15, 8, 30));
  ImmutableValue snap = Snapshot(Value(date));
  date->SetUtcFullYear(1999);

  const ImmutableDate& frozen = snap.AsDate();
  EXPECT_EQ(frozen.GetUtcFullYear(), 2025.0);
  EXPECT_EQ(frozen.GetUtcMonth(), 5.0);
  EXPECT_EQ(frozen.GetUtcHours(), 8.0);
  EXPECT_EQ(frozen.ToIsoString(), "2025-06-15T08:30:00.000Z");
  EXPECT_EQ(frozen.ValueOf(), frozen.GetTime());
}

TEST(ImmutableDateTest, SettersThrow) {
  ImmutableValue snap = Snapshot(Value(std::make_shared<Date>(0.0)));
  const ImmutableDate& frozen = snap.AsDate();

  EXPECT_THROW(frozen.SetTime(1), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcFullYear(2000), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcMonth(1), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcDate(2), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcHours(3), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcMinutes(4), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcSeconds(5), ImmutableSnapshotError);
  EXPECT_THROW(frozen.SetUtcMilliseconds(6), ImmutableSnapshotError);
  EXPECT_EQ(frozen.GetTime(), 0.0);
}

TEST(ImmutableDateTest, ToDateIsIndependent) {
  ImmutableValue snap = Snapshot(Value(std::make_shared<Date>(1000.0)));
  Date copy = snap.AsDate().ToDate();
  copy.SetTime(5000);

  EXPECT_EQ(snap.AsDate().GetTime(), 1000.0);
  EXPECT_EQ(copy.GetTime(), 5000.0);
}

// -----------------------------------------------------------------------------
// Pattern
// -----------------------------------------------------------------------------
TEST(ImmutablePatternTest, ExecDoesNotAdvanceLastIndex) {
  auto pattern = std::make_shared<Pattern>("\\d", "g");
  pattern->SetLastIndex(2);
  ImmutableValue snap = Snapshot(Value(pattern));
  pattern->SetLastIndex(0);

  const ImmutablePattern& frozen = snap.AsPattern();
  ASSERT_EQ(frozen.LastIndex(), 2u);

  auto first = frozen.Exec("1a2b3");
  auto second = frozen.Exec("1a2b3");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->index, 2u) << "Search starts at the frozen cursor";
  EXPECT_EQ(second->index, 2u);
  EXPECT_EQ(frozen.LastIndex(), 2u);
}

TEST(ImmutablePatternTest, MutatorsThrowAndCopiesAreFresh) {
  ImmutableValue snap = Snapshot(Value(std::make_shared<Pattern>("ab+", "iy")));
  const ImmutablePattern& frozen = snap.AsPattern();

  EXPECT_THROW(frozen.SetLastIndex(1), ImmutableSnapshotError);
  EXPECT_THROW(frozen.Compile("x"), ImmutableSnapshotError);

  Pattern copy = frozen.ToPattern();
  EXPECT_EQ(copy.Source(), "ab+");
  EXPECT_EQ(copy.Flags(), "iy");
  EXPECT_TRUE(copy.Test("ABB"));
  EXPECT_EQ(copy.LastIndex(), 3u);
  EXPECT_EQ(frozen.LastIndex(), 0u);
}

}  // namespace
}  // namespace simcore::snapshot
