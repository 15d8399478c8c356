// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstdint>
#include <ctime>
#include <string_view>

#include "pw_async2/coro.h"
#include "pw_async2/time_provider.h"
#include "pw_chrono/system_clock.h"
#include "pw_result/result.h"
#include "steel_core/modules/tag_payload/steel_protocol.h"
#include "steel_core/modules/tag_session/tag_reader_driver.h"
#include "steel_core/modules/tag_session/tag_session_fsm.h"
#include "steel_core/modules/tag_session/tag_session_types.h"
#include "steel_core/types.h"

namespace steel::tag_session {

inline constexpr std::string_view kMultipleTagsAlert =
    "More than 1 tag detected. Please use only one Steel card.";
inline constexpr std::string_view kReadSuccessAlert = "Steel member detected!";
inline constexpr std::string_view kWriteSuccessAlert =
    "Steel tag written successfully!";

/// One physical reader interaction:
/// connect -> query capability -> read or write -> finish.
///
/// Drives TagSessionFsm with the results of TagReaderDriver operations.
/// Only one interaction is active at a time; starting a new one supersedes
/// the previous, whose coroutine then completes with TagSessionCancelled.
///
/// The returned coroutine only fails (non-OK Result) if the coroutine
/// machinery itself fails, e.g. frame allocation.
class TagSession {
 public:
  TagSession(TagReaderDriver& driver,
             pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider,
             const TagSessionConfig& config = {});

  /// Reads the Steel identity from the next tag presented.
  pw::async2::Coro<pw::Result<TagSessionOutcome>> Read(
      pw::async2::CoroContext& cx);

  /// Writes the Steel payload for `member_id` to the next tag presented.
  pw::async2::Coro<pw::Result<TagSessionOutcome>> Write(
      pw::async2::CoroContext& cx,
      const MemberId& member_id,
      std::string_view display_name,
      std::time_t now_utc);

  /// Invalidates the running interaction. The pending Read/Write completes
  /// with TagSessionCancelled. No-op when idle or finished.
  void Cancel();

  TagSessionStateId state() const { return fsm_.state(); }

  bool active() const {
    return state() != TagSessionStateId::kIdle &&
           state() != TagSessionStateId::kFinished;
  }

 private:
  uint32_t Begin(TagSessionMode mode);
  pw::async2::Coro<pw::Result<TagSessionOutcome>> Execute(
      pw::async2::CoroContext& cx, uint32_t generation);
  void EndHardwareSession(const TagSessionOutcome& outcome);

  bool IsCurrent(uint32_t generation) const {
    return generation == generation_;
  }

  TagReaderDriver& driver_;
  pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider_;
  TagSessionConfig config_;
  TagSessionFsm fsm_;
  uint32_t generation_ = 0;
  std::array<std::byte, tag_payload::kMaxNdefMessageSize> read_buffer_{};
};

}  // namespace steel::tag_session
