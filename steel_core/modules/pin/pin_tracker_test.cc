// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/pin/pin_tracker.h"

#include "pw_unit_test/framework.h"

namespace steel::pin {
namespace {

TEST(PinTrackerTest, StartsEmpty) {
  PinTracker pin;
  EXPECT_EQ(pin.length(), kDefaultPinLength);
  EXPECT_TRUE(pin.empty());
  EXPECT_FALSE(pin.IsComplete());
  EXPECT_TRUE(pin.AsString().empty());
}

TEST(PinTrackerTest, FourDigitsComplete) {
  PinTracker pin(4);
  EXPECT_EQ(pin.Append(7), pw::OkStatus());
  EXPECT_EQ(pin.Append(0), pw::OkStatus());
  EXPECT_EQ(pin.Append(3), pw::OkStatus());
  EXPECT_FALSE(pin.IsComplete());
  EXPECT_EQ(pin.Append(9), pw::OkStatus());

  EXPECT_TRUE(pin.IsComplete());
  EXPECT_EQ(std::string_view(pin.AsString()), "7039");
}

TEST(PinTrackerTest, RemoveLastThenAppendRestoresCompleteness) {
  PinTracker pin(4);
  for (uint8_t d : {1, 2, 3, 4}) {
    ASSERT_EQ(pin.Append(d), pw::OkStatus());
  }

  pin.RemoveLast();
  EXPECT_FALSE(pin.IsComplete());
  EXPECT_FALSE(pin.digit(3).has_value());

  EXPECT_EQ(pin.Append(8), pw::OkStatus());
  EXPECT_TRUE(pin.IsComplete());
  EXPECT_EQ(pin.digit(3), std::optional<uint8_t>(8));
  EXPECT_EQ(std::string_view(pin.AsString()), "1238");
}

TEST(PinTrackerTest, AppendWhenFullIsNoOp) {
  PinTracker pin(2);
  ASSERT_EQ(pin.Append(1), pw::OkStatus());
  ASSERT_EQ(pin.Append(2), pw::OkStatus());

  EXPECT_EQ(pin.Append(3), pw::Status::ResourceExhausted());
  EXPECT_EQ(std::string_view(pin.AsString()), "12");
}

TEST(PinTrackerTest, RejectsNonDigit) {
  PinTracker pin;
  EXPECT_EQ(pin.Append(10), pw::Status::InvalidArgument());
  EXPECT_TRUE(pin.empty());
}

TEST(PinTrackerTest, RemoveLastWhenEmptyIsNoOp) {
  PinTracker pin;
  pin.RemoveLast();
  EXPECT_TRUE(pin.empty());
}

TEST(PinTrackerTest, PartialEntryReturnsDigitsSoFar) {
  PinTracker pin(6);
  ASSERT_EQ(pin.Append(0), pw::OkStatus());
  ASSERT_EQ(pin.Append(5), pw::OkStatus());
  EXPECT_EQ(std::string_view(pin.AsString()), "05");
}

TEST(PinTrackerTest, ClearEmptiesAllSlots) {
  PinTracker pin;
  ASSERT_EQ(pin.Append(4), pw::OkStatus());
  ASSERT_EQ(pin.Append(2), pw::OkStatus());

  pin.Clear();
  EXPECT_TRUE(pin.empty());
  EXPECT_FALSE(pin.digit(0).has_value());
  EXPECT_EQ(pin.length(), kDefaultPinLength);
}

TEST(PinTrackerTest, ResizeClearsAndChangesLength) {
  PinTracker pin;
  ASSERT_EQ(pin.Append(1), pw::OkStatus());

  EXPECT_EQ(pin.Resize(6), pw::OkStatus());
  EXPECT_EQ(pin.length(), 6u);
  EXPECT_TRUE(pin.empty());

  EXPECT_EQ(pin.Resize(0), pw::Status::InvalidArgument());
  EXPECT_EQ(pin.Resize(kMaxPinLength + 1), pw::Status::InvalidArgument());
  EXPECT_EQ(pin.length(), 6u);
}

}  // namespace
}  // namespace steel::pin
