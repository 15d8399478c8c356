// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include "steel_core/modules/feedback/feedback_sink.h"

namespace steel::feedback {

/// Feedback sink for hosts without haptics: logs each event.
class LoggingFeedbackSink : public FeedbackSink {
 public:
  void Play(FeedbackEvent event) override;
};

}  // namespace steel::feedback
