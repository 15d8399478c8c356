// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/feedback/feedback_sink.h"

#include <string_view>

#include "pw_unit_test/framework.h"
#include "steel_core/modules/feedback/logging_feedback_sink.h"
#include "steel_core/modules/feedback/mock/mock_feedback_sink.h"

namespace steel::feedback {
namespace {

TEST(FeedbackTest, EventNamesAreStable) {
  EXPECT_EQ(std::string_view(FeedbackEventName(FeedbackEvent::kTagDetected)),
            "tag-detected");
  EXPECT_EQ(
      std::string_view(FeedbackEventName(FeedbackEvent::kPinDigitEntered)),
      "pin-digit");
  EXPECT_EQ(std::string_view(FeedbackEventName(FeedbackEvent::kPinCorrect)),
            "pin-correct");
  EXPECT_EQ(std::string_view(FeedbackEventName(FeedbackEvent::kPinIncorrect)),
            "pin-incorrect");
  EXPECT_EQ(
      std::string_view(FeedbackEventName(FeedbackEvent::kProfileRevealed)),
      "profile-revealed");
}

TEST(FeedbackTest, LoggingSinkAcceptsEveryEvent) {
  LoggingFeedbackSink sink;
  FeedbackSink& as_sink = sink;
  as_sink.Play(FeedbackEvent::kTagDetected);
  as_sink.Play(FeedbackEvent::kProfileRevealed);
}

TEST(FeedbackTest, MockRecordsEventsInOrder) {
  MockFeedbackSink sink;
  sink.Play(FeedbackEvent::kPinDigitEntered);
  sink.Play(FeedbackEvent::kPinDigitEntered);
  sink.Play(FeedbackEvent::kPinIncorrect);

  ASSERT_EQ(sink.events().size(), 3u);
  EXPECT_EQ(sink.count(FeedbackEvent::kPinDigitEntered), 2u);
  EXPECT_EQ(sink.last(), FeedbackEvent::kPinIncorrect);

  sink.Reset();
  EXPECT_FALSE(sink.last().has_value());
}

}  // namespace
}  // namespace steel::feedback
