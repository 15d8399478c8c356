// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>

#include "pw_async2/coro.h"
#include "pw_chrono/system_clock.h"
#include "pw_result/result.h"
#include "steel_core/types.h"

namespace steel::pin_delivery {

/// One PIN challenge: the backend sent a PIN to the sharer's phone and the
/// receiver has until `expires_at` to enter it.
///
/// Times are on the local system clock (see time::ClockReference).
struct VerificationSession {
  SessionId session_id = SessionId::Empty();
  MemberId sharer_id = MemberId::Empty();
  pw::chrono::SystemClock::time_point created_at;
  pw::chrono::SystemClock::time_point expires_at;
  uint8_t pin_length = kDefaultPinLength;
  /// Expected PIN, only present for offline or simulated sessions.
  std::optional<PinCode> simulated_pin;
};

/// Backend that delivers a PIN to the sharer and checks the receiver's
/// answer.
///
/// Each call is a single coroutine. Any non-OK status is a transport or
/// backend failure; a wrong PIN is an OK result carrying `false`.
///
/// Typical usage (within a coroutine):
/// @code
///   PW_CO_TRY_ASSIGN(auto session, co_await client.SendPin(cx, sharer));
///   // ... collect the PIN ...
///   PW_CO_TRY_ASSIGN(bool ok,
///                    co_await client.VerifyPin(cx, session.session_id, pin));
/// @endcode
class PinDeliveryClient {
 public:
  virtual ~PinDeliveryClient() = default;

  /// Asks the backend to send a PIN to the owner of `sharer_id`.
  virtual pw::async2::Coro<pw::Result<VerificationSession>> SendPin(
      pw::async2::CoroContext& cx, const MemberId& sharer_id) = 0;

  /// Checks `pin` against the challenge `session_id`.
  /// @return true if the PIN matches
  virtual pw::async2::Coro<pw::Result<bool>> VerifyPin(
      pw::async2::CoroContext& cx,
      const SessionId& session_id,
      const PinCode& pin) = 0;
};

}  // namespace steel::pin_delivery
