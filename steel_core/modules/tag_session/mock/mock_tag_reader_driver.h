// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

#include "pw_async2/coro.h"
#include "pw_async2/value_future.h"
#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "pw_status/status.h"
#include "steel_core/modules/tag_session/tag_reader_driver.h"

namespace steel::tag_session {

/// Mock tag reader for the host demo and unit tests.
///
/// Holds the contents of a single simulated tag. Writes replace the
/// contents, so a write followed by a read sees the written message.
///
/// With set_hold_operations(true), every asynchronous operation waits until
/// ReleaseHeldOperation() or Invalidate() is called. This lets tests observe
/// intermediate session states and cancel mid-operation.
class MockTagReaderDriver : public TagReaderDriver {
 public:
  MockTagReaderDriver() = default;

  // -- TagReaderDriver Interface --

  bool IsAvailable() const override { return available_; }

  pw::async2::Coro<pw::Result<size_t>> Connect(
      pw::async2::CoroContext& cx) override;

  void RestartPolling() override { restart_polling_count_++; }

  pw::async2::Coro<pw::Result<NdefCapability>> QueryCapability(
      pw::async2::CoroContext& cx) override;

  pw::async2::Coro<pw::Result<size_t>> ReadNdef(pw::async2::CoroContext& cx,
                                                pw::ByteSpan buffer) override;

  pw::async2::Coro<pw::Status> WriteNdef(pw::async2::CoroContext& cx,
                                         pw::ConstByteSpan message) override;

  void SetAlertMessage(std::string_view message) override {
    alert_message_.assign(message.begin(), message.end());
    alert_count_++;
  }

  void Invalidate() override;

  // -- Simulation Helpers --

  void set_available(bool available) { available_ = available; }

  /// Queues the result of the next Connect() call. Once the queue is empty,
  /// Connect() reports a single tag.
  void QueueConnectResult(pw::Result<size_t> result) {
    connect_results_.push_back(result);
  }

  void set_capability(pw::Result<NdefCapability> capability) {
    capability_ = capability;
  }

  /// Sets the NDEF message stored on the simulated tag.
  void SetTagContents(pw::ConstByteSpan contents) {
    contents_.assign(contents.begin(), contents.end());
  }

  /// Error returned by the next ReadNdef() call.
  void SetNextReadError(pw::Status status) { next_read_error_ = status; }

  /// Status returned by WriteNdef(). Contents are only replaced on OK.
  void set_write_status(pw::Status status) { write_status_ = status; }

  void set_hold_operations(bool hold) { hold_operations_ = hold; }

  /// Lets the operation waiting under set_hold_operations(true) continue.
  void ReleaseHeldOperation();

  // -- Test Inspection --

  bool operation_pending() const { return operation_pending_; }
  size_t connect_count() const { return connect_count_; }
  size_t restart_polling_count() const { return restart_polling_count_; }
  size_t read_count() const { return read_count_; }
  size_t write_count() const { return write_count_; }
  size_t invalidate_count() const { return invalidate_count_; }
  size_t alert_count() const { return alert_count_; }
  const std::string& alert_message() const { return alert_message_; }

  pw::ConstByteSpan tag_contents() const {
    return pw::ConstByteSpan(contents_.data(), contents_.size());
  }

 private:
  /// Suspends while operations are held. Returns Cancelled on Invalidate().
  pw::async2::Coro<pw::Status> WaitIfHeld(pw::async2::CoroContext& cx);

  bool available_ = true;
  std::deque<pw::Result<size_t>> connect_results_;
  pw::Result<NdefCapability> capability_ = NdefCapability::kReadWrite;
  std::vector<std::byte> contents_;
  pw::Status next_read_error_;
  pw::Status write_status_;

  bool hold_operations_ = false;
  bool operation_pending_ = false;
  pw::async2::ValueProvider<pw::Status> release_provider_;

  size_t connect_count_ = 0;
  size_t restart_polling_count_ = 0;
  size_t read_count_ = 0;
  size_t write_count_ = 0;
  size_t invalidate_count_ = 0;
  size_t alert_count_ = 0;
  std::string alert_message_;
};

}  // namespace steel::tag_session
