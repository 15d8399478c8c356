// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

#include "pw_async2/time_provider.h"
#include "pw_chrono/system_clock.h"
#include "steel_core/modules/pin_delivery/pin_delivery_client.h"

namespace steel::pin_delivery {
using namespace std::chrono_literals;

/// Offline PIN delivery for demos and development: no SMS is sent.
///
/// Every session expects the same fixed PIN and carries it as
/// `simulated_pin`. Sessions are remembered so VerifyPin can enforce the
/// expiry like the real backend.
class SimulatedPinDeliveryClient : public PinDeliveryClient {
 public:
  static constexpr std::string_view kPin = "1234";
  static constexpr auto kSessionLifetime = 2min;
  static constexpr auto kSendDelay = 800ms;
  static constexpr auto kVerifyDelay = 500ms;

  explicit SimulatedPinDeliveryClient(
      pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider)
      : time_provider_(time_provider) {}

  pw::async2::Coro<pw::Result<VerificationSession>> SendPin(
      pw::async2::CoroContext& cx, const MemberId& sharer_id) override;

  pw::async2::Coro<pw::Result<bool>> VerifyPin(
      pw::async2::CoroContext& cx,
      const SessionId& session_id,
      const PinCode& pin) override;

 private:
  pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider_;
  uint32_t next_session_ = 1;
  // Only the latest session is valid.
  std::optional<VerificationSession> current_;
};

}  // namespace steel::pin_delivery
