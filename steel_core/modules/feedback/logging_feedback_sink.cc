// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "FDBK"

#include "steel_core/modules/feedback/logging_feedback_sink.h"

#include "pw_log/log.h"

namespace steel::feedback {

void LoggingFeedbackSink::Play(FeedbackEvent event) {
  PW_LOG_INFO("Feedback: %s", FeedbackEventName(event));
}

}  // namespace steel::feedback
