// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <string_view>

#include "pw_async2/coro.h"
#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "pw_status/status.h"
#include "steel_core/modules/tag_session/tag_session_types.h"

namespace steel::tag_session {

/// Hardware interface for an NDEF tag reader/writer.
///
/// Each asynchronous operation is a single coroutine returning a result.
/// Any operation may return Cancelled when the user dismissed the reader
/// (e.g. a system scan sheet); TagSession treats that as a cancellation,
/// not as an error.
///
/// Only one operation is in flight at a time.
class TagReaderDriver {
 public:
  virtual ~TagReaderDriver() = default;

  /// Whether the device has a usable reader at all.
  virtual bool IsAvailable() const = 0;

  /// Waits for tags in the field. When exactly one tag is present it is
  /// connected before returning.
  /// @return Number of tags detected (>= 1), or an error
  virtual pw::async2::Coro<pw::Result<size_t>> Connect(
      pw::async2::CoroContext& cx) = 0;

  /// Drops the current detection and starts polling again.
  virtual void RestartPolling() = 0;

  virtual pw::async2::Coro<pw::Result<NdefCapability>> QueryCapability(
      pw::async2::CoroContext& cx) = 0;

  /// Reads the raw NDEF message into `buffer`.
  /// @return Bytes read; 0 for a formatted tag without a message
  virtual pw::async2::Coro<pw::Result<size_t>> ReadNdef(
      pw::async2::CoroContext& cx, pw::ByteSpan buffer) = 0;

  virtual pw::async2::Coro<pw::Status> WriteNdef(
      pw::async2::CoroContext& cx, pw::ConstByteSpan message) = 0;

  /// Status text shown by the reader UI, where the platform has one.
  virtual void SetAlertMessage(std::string_view message) = 0;

  /// Ends the hardware session. Pending operations complete with
  /// Cancelled.
  virtual void Invalidate() = 0;
};

}  // namespace steel::tag_session
