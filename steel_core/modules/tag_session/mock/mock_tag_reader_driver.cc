// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/tag_session/mock/mock_tag_reader_driver.h"

#include <algorithm>

#include "pw_status/try.h"

namespace steel::tag_session {

pw::async2::Coro<pw::Status> MockTagReaderDriver::WaitIfHeld(
    pw::async2::CoroContext& /*cx*/) {
  if (!hold_operations_) {
    co_return pw::OkStatus();
  }
  operation_pending_ = true;
  pw::Status status = co_await release_provider_.Get();
  operation_pending_ = false;
  co_return status;
}

void MockTagReaderDriver::ReleaseHeldOperation() {
  if (operation_pending_) {
    release_provider_.Resolve(pw::OkStatus());
  }
}

void MockTagReaderDriver::Invalidate() {
  invalidate_count_++;
  if (operation_pending_) {
    release_provider_.Resolve(pw::Status::Cancelled());
  }
}

pw::async2::Coro<pw::Result<size_t>> MockTagReaderDriver::Connect(
    pw::async2::CoroContext& cx) {
  connect_count_++;
  PW_CO_TRY(co_await WaitIfHeld(cx));

  if (connect_results_.empty()) {
    co_return size_t{1};
  }
  pw::Result<size_t> result = connect_results_.front();
  connect_results_.pop_front();
  co_return result;
}

pw::async2::Coro<pw::Result<NdefCapability>>
MockTagReaderDriver::QueryCapability(pw::async2::CoroContext& cx) {
  PW_CO_TRY(co_await WaitIfHeld(cx));
  co_return capability_;
}

pw::async2::Coro<pw::Result<size_t>> MockTagReaderDriver::ReadNdef(
    pw::async2::CoroContext& cx, pw::ByteSpan buffer) {
  read_count_++;
  PW_CO_TRY(co_await WaitIfHeld(cx));

  if (!next_read_error_.ok()) {
    pw::Status error = next_read_error_;
    next_read_error_ = pw::OkStatus();
    co_return error;
  }
  if (contents_.size() > buffer.size()) {
    co_return pw::Status::ResourceExhausted();
  }
  std::copy(contents_.begin(), contents_.end(), buffer.begin());
  co_return contents_.size();
}

pw::async2::Coro<pw::Status> MockTagReaderDriver::WriteNdef(
    pw::async2::CoroContext& cx, pw::ConstByteSpan message) {
  write_count_++;
  PW_CO_TRY(co_await WaitIfHeld(cx));

  if (write_status_.ok()) {
    contents_.assign(message.begin(), message.end());
  }
  co_return write_status_;
}

}  // namespace steel::tag_session
