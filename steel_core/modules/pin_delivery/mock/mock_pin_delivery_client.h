// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "pw_async2/coro.h"
#include "pw_async2/value_future.h"
#include "pw_result/result.h"
#include "steel_core/modules/pin_delivery/pin_delivery_client.h"

namespace steel::pin_delivery {

/// Mock PIN delivery backend for unit tests.
///
/// By default calls complete immediately with the configured results.
/// With set_deferred(true) they stay pending until CompleteSendPin() or
/// CompleteVerifyPin() is called, so tests can act while a call is in
/// flight.
class MockPinDeliveryClient : public PinDeliveryClient {
 public:
  MockPinDeliveryClient() = default;

  pw::async2::Coro<pw::Result<VerificationSession>> SendPin(
      pw::async2::CoroContext& cx, const MemberId& sharer_id) override;

  pw::async2::Coro<pw::Result<bool>> VerifyPin(
      pw::async2::CoroContext& cx,
      const SessionId& session_id,
      const PinCode& pin) override;

  // -- Test Helpers --

  /// Session valid until `expires_at`, with no simulated PIN.
  static VerificationSession MakeSession(
      std::string_view session_id,
      std::string_view sharer_id,
      pw::chrono::SystemClock::time_point expires_at,
      uint8_t pin_length = kDefaultPinLength);

  void SetSendPinResult(pw::Result<VerificationSession> result) {
    send_result_ = std::move(result);
  }
  void SetVerifyPinResult(pw::Result<bool> result) { verify_result_ = result; }

  void set_deferred(bool deferred) { deferred_ = deferred; }

  /// Resolves a pending SendPin. No-op if none is pending.
  void CompleteSendPin(pw::Result<VerificationSession> result);

  /// Resolves a pending VerifyPin. No-op if none is pending.
  void CompleteVerifyPin(pw::Result<bool> result);

  bool send_pending() const { return send_pending_; }
  bool verify_pending() const { return verify_pending_; }
  size_t send_count() const { return send_count_; }
  size_t verify_count() const { return verify_count_; }
  const MemberId& last_sharer_id() const { return last_sharer_id_; }
  const SessionId& last_session_id() const { return last_session_id_; }
  const PinCode& last_pin() const { return last_pin_; }

 private:
  pw::Result<VerificationSession> send_result_ = pw::Status::Unavailable();
  pw::Result<bool> verify_result_ = pw::Status::Unavailable();
  bool deferred_ = false;

  bool send_pending_ = false;
  bool verify_pending_ = false;
  pw::async2::ValueProvider<pw::Result<VerificationSession>> send_provider_;
  pw::async2::ValueProvider<pw::Result<bool>> verify_provider_;

  size_t send_count_ = 0;
  size_t verify_count_ = 0;
  MemberId last_sharer_id_ = MemberId::Empty();
  SessionId last_session_id_ = SessionId::Empty();
  PinCode last_pin_;
};

}  // namespace steel::pin_delivery
