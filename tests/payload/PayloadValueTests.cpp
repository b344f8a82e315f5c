// Repository: simcore
// Component: Payload value model unit tests

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

#include "simcore/payload/Payload.hpp"

namespace simcore::payload {
namespace {

// -----------------------------------------------------------------------------
// Containers alias on copy
// -----------------------------------------------------------------------------
TEST(PayloadValueTest, CopiesAliasContainers) {
  Value original = Record{{"count", 1}};
  Value alias = original;

  alias.AsRecord()["count"] = 2;

  EXPECT_EQ(original.AsRecord()["count"].AsNumber(), 2.0);
  EXPECT_EQ(original.Identity(), alias.Identity());
}

TEST(PayloadValueTest, KindsMatchConstructors) {
  EXPECT_EQ(Value().kind(), ValueKind::kNull);
  EXPECT_EQ(Value(true).kind(), ValueKind::kBoolean);
  EXPECT_EQ(Value(3).kind(), ValueKind::kNumber);
  EXPECT_EQ(Value("text").kind(), ValueKind::kString);
  EXPECT_EQ(Value(List{1, 2}).kind(), ValueKind::kList);
  EXPECT_EQ(Value(std::make_shared<MapContainer>()).kind(), ValueKind::kMap);
  EXPECT_EQ(Value(std::make_shared<Date>(0.0)).kind(), ValueKind::kDate);
  EXPECT_STREQ(ValueKindToString(ValueKind::kSharedByteBuffer), "shared_byte_buffer");
}

TEST(PayloadValueTest, SameValueZeroTreatsNaNAsEqual) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  EXPECT_TRUE(SameValueZero(Value(nan), Value(nan)));
  EXPECT_TRUE(SameValueZero(Value(0.0), Value(-0.0)));
  EXPECT_FALSE(SameValueZero(Value(1), Value("1")));
  EXPECT_FALSE(SameValueZero(Value(List{}), Value(List{})))
      << "Distinct containers compare by identity";
}

// -----------------------------------------------------------------------------
// MapContainer / SetContainer
// -----------------------------------------------------------------------------
TEST(PayloadContainersTest, MapOverwriteKeepsInsertionPosition) {
  MapContainer map{{"a", 1}, {"b", 2}};
  map.Set("a", 10);

  ASSERT_EQ(map.Size(), 2u);
  EXPECT_EQ(map.Entries()[0].first.AsString(), "a");
  EXPECT_EQ(map.Entries()[0].second.AsNumber(), 10.0);
  EXPECT_TRUE(map.Delete("b"));
  EXPECT_FALSE(map.Has("b"));
  EXPECT_EQ(map.Get("missing"), nullptr);
}

TEST(PayloadContainersTest, SetIgnoresDuplicates) {
  SetContainer set{1, 2, 2, "x"};
  EXPECT_EQ(set.Size(), 3u);
  EXPECT_FALSE(set.Add(1));
  EXPECT_TRUE(set.Has("x"));
}

// -----------------------------------------------------------------------------
// Buffers
// -----------------------------------------------------------------------------
TEST(PayloadBuffersTest, SharedHandlesSeeEachOthersWrites) {
  auto first = std::make_shared<SharedByteBuffer>(4);
  auto second = first->Share();

  second->SetAt(2, 9);

  EXPECT_EQ(first->At(2), 9);
  EXPECT_EQ(first->StorageId(), second->StorageId());
  EXPECT_EQ(Value(first).Identity(), Value(second).Identity());
}

TEST(PayloadBuffersTest, IntegerElementsWrap) {
  NumericArray bytes(NumericElementType::kUint8, {256, -1, 3.9});
  EXPECT_EQ(bytes.At(0), 0.0);
  EXPECT_EQ(bytes.At(1), 255.0);
  EXPECT_EQ(bytes.At(2), 3.0);

  NumericArray signed_bytes(NumericElementType::kInt8, {200});
  EXPECT_EQ(signed_bytes.At(0), -56.0);

  NumericArray nan_ints(NumericElementType::kInt32, {std::nan("")});
  EXPECT_EQ(nan_ints.At(0), 0.0);
}

TEST(PayloadBuffersTest, ViewsShareTheUnderlyingBuffer) {
  auto buffer = std::make_shared<ByteBuffer>(8);
  NumericArray view(NumericElementType::kUint16, buffer, 2, 3);

  view.SetAt(0, 0x0101);

  EXPECT_EQ(buffer->At(2), 1);
  EXPECT_EQ(buffer->At(3), 1);
  EXPECT_EQ(view.ByteLength(), 6u);
}

TEST(PayloadBuffersTest, MisalignedOrOversizedViewThrows) {
  auto buffer = std::make_shared<ByteBuffer>(8);
  EXPECT_THROW(NumericArray(NumericElementType::kUint32, buffer, 2, 1),
               std::invalid_argument);
  EXPECT_THROW(NumericArray(NumericElementType::kUint32, buffer, 4, 2),
               std::invalid_argument);
  EXPECT_THROW(buffer->At(8), std::out_of_range);
}

// -----------------------------------------------------------------------------
// Date
// -----------------------------------------------------------------------------
TEST(PayloadDateTest, FieldsAndIsoFormatting) {
  Date date = Date::FromUtc(2024, 1, 29, 13, 5, 9, 7);

  EXPECT_EQ(date.GetUtcFullYear(), 2024.0);
  EXPECT_EQ(date.GetUtcMonth(), 1.0);
  EXPECT_EQ(date.GetUtcDate(), 29.0);
  EXPECT_EQ(date.GetUtcDay(), 4.0);  // Thursday
  EXPECT_EQ(date.ToIsoString(), "2024-02-29T13:05:09.007Z");
  EXPECT_EQ(Date(0).ToIsoString(), "1970-01-01T00:00:00.000Z");
}

TEST(PayloadDateTest, SettersNormalizeOverflow) {
  Date date = Date::FromUtc(2024, 0, 31);
  date.SetUtcMonth(1);  // Feb 31 rolls into March
  EXPECT_EQ(date.ToIsoString(), "2024-03-02T00:00:00.000Z");

  date.SetUtcMonth(12);
  EXPECT_EQ(date.GetUtcFullYear(), 2025.0);
  EXPECT_EQ(date.GetUtcMonth(), 0.0);
}

TEST(PayloadDateTest, InvalidDateReportsNaNAndRefusesIso) {
  Date date(std::numeric_limits<double>::quiet_NaN());
  EXPECT_FALSE(date.IsValid());
  EXPECT_TRUE(std::isnan(date.GetUtcHours()));
  EXPECT_THROW(date.ToIsoString(), std::range_error);

  date.SetUtcFullYear(2000);
  EXPECT_TRUE(date.IsValid());
  EXPECT_EQ(date.ToIsoString(), "2000-01-01T00:00:00.000Z");
}

// -----------------------------------------------------------------------------
// Pattern
// -----------------------------------------------------------------------------
TEST(PayloadPatternTest, GlobalExecAdvancesLastIndex) {
  Pattern pattern("item-(\\d+)", "g");
  const std::string input = "item-1 item-22";

  auto first = pattern.Exec(input);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->groups[1].value(), "1");
  EXPECT_EQ(pattern.LastIndex(), 6u);

  auto second = pattern.Exec(input);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->index, 7u);
  EXPECT_EQ(second->groups[1].value(), "22");

  EXPECT_FALSE(pattern.Exec(input).has_value());
  EXPECT_EQ(pattern.LastIndex(), 0u) << "A failed global match resets the cursor";
}

TEST(PayloadPatternTest, FlagsAreValidated) {
  EXPECT_THROW(Pattern("a", "q"), std::invalid_argument);
  EXPECT_THROW(Pattern("a", "gg"), std::invalid_argument);
  EXPECT_THROW(Pattern("a", "s"), std::invalid_argument);
  EXPECT_THROW(Pattern("a", "u"), std::invalid_argument);
  EXPECT_THROW(Pattern("(", ""), std::invalid_argument);

  Pattern insensitive("abc", "i");
  EXPECT_TRUE(insensitive.Test("xABCx"));
  EXPECT_TRUE(insensitive.IgnoreCase());
}

TEST(PayloadPatternTest, StickyMatchesOnlyAtCursor) {
  Pattern sticky("b", "y");
  EXPECT_FALSE(sticky.Test("ab"));
  sticky.SetLastIndex(1);
  EXPECT_TRUE(sticky.Test("ab"));
}

}  // namespace
}  // namespace simcore::payload
