// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/feedback/feedback_sink.h"

namespace steel::feedback {

const char* FeedbackEventName(FeedbackEvent event) {
  switch (event) {
    case FeedbackEvent::kTagDetected:
      return "tag-detected";
    case FeedbackEvent::kPinDigitEntered:
      return "pin-digit";
    case FeedbackEvent::kPinCorrect:
      return "pin-correct";
    case FeedbackEvent::kPinIncorrect:
      return "pin-incorrect";
    case FeedbackEvent::kProfileRevealed:
      return "profile-revealed";
  }
  return "unknown";
}

}  // namespace steel::feedback
