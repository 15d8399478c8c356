// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/pin_delivery/mock/mock_pin_delivery_client.h"

namespace steel::pin_delivery {

VerificationSession MockPinDeliveryClient::MakeSession(
    std::string_view session_id,
    std::string_view sharer_id,
    pw::chrono::SystemClock::time_point expires_at,
    uint8_t pin_length) {
  VerificationSession session;
  session.session_id = *SessionId::FromString(session_id);
  session.sharer_id = *MemberId::FromString(sharer_id);
  session.expires_at = expires_at;
  session.pin_length = pin_length;
  return session;
}

pw::async2::Coro<pw::Result<VerificationSession>>
MockPinDeliveryClient::SendPin(pw::async2::CoroContext& /*cx*/,
                               const MemberId& sharer_id) {
  send_count_++;
  last_sharer_id_ = sharer_id;
  if (!deferred_) {
    co_return send_result_;
  }
  send_pending_ = true;
  pw::Result<VerificationSession> result = co_await send_provider_.Get();
  send_pending_ = false;
  co_return result;
}

pw::async2::Coro<pw::Result<bool>> MockPinDeliveryClient::VerifyPin(
    pw::async2::CoroContext& /*cx*/,
    const SessionId& session_id,
    const PinCode& pin) {
  verify_count_++;
  last_session_id_ = session_id;
  last_pin_ = pin;
  if (!deferred_) {
    co_return verify_result_;
  }
  verify_pending_ = true;
  pw::Result<bool> result = co_await verify_provider_.Get();
  verify_pending_ = false;
  co_return result;
}

void MockPinDeliveryClient::CompleteSendPin(
    pw::Result<VerificationSession> result) {
  if (send_pending_) {
    send_provider_.Resolve(std::move(result));
  }
}

void MockPinDeliveryClient::CompleteVerifyPin(pw::Result<bool> result) {
  if (verify_pending_) {
    verify_provider_.Resolve(result);
  }
}

}  // namespace steel::pin_delivery
