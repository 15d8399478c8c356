// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

#include "steel_core/modules/feedback/feedback_sink.h"

namespace steel::feedback {

/// Silent feedback sink for unit tests. Records every event in order.
class MockFeedbackSink : public FeedbackSink {
 public:
  MockFeedbackSink() = default;

  void Play(FeedbackEvent event) override { events_.push_back(event); }

  // -- Test Helpers --

  const std::vector<FeedbackEvent>& events() const { return events_; }

  size_t count(FeedbackEvent event) const {
    return static_cast<size_t>(
        std::count(events_.begin(), events_.end(), event));
  }

  std::optional<FeedbackEvent> last() const {
    if (events_.empty()) {
      return std::nullopt;
    }
    return events_.back();
  }

  void Reset() { events_.clear(); }

 private:
  std::vector<FeedbackEvent> events_;
};

}  // namespace steel::feedback
