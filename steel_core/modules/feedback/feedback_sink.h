// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

namespace steel::feedback {

/// Moments of the verification flow that deserve user feedback.
enum class FeedbackEvent : uint8_t {
  kTagDetected,
  kPinDigitEntered,
  kPinCorrect,
  kPinIncorrect,
  kProfileRevealed,
};

/// Stable name of an event, e.g. "pin-digit".
const char* FeedbackEventName(FeedbackEvent event);

/// Plays haptic, audio or visual feedback for flow events.
///
/// Play() must not block: implementations start the effect and return.
class FeedbackSink {
 public:
  virtual ~FeedbackSink() = default;

  virtual void Play(FeedbackEvent event) = 0;
};

}  // namespace steel::feedback
