// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "PDEL"

#include "steel_core/modules/pin_delivery/simulated_pin_delivery_client.h"

#include "pw_log/log.h"
#include "pw_string/string_builder.h"

namespace steel::pin_delivery {

pw::async2::Coro<pw::Result<VerificationSession>>
SimulatedPinDeliveryClient::SendPin(pw::async2::CoroContext& /*cx*/,
                                    const MemberId& sharer_id) {
  if (sharer_id.empty()) {
    co_return pw::Status::InvalidArgument();
  }
  co_await time_provider_.WaitFor(kSendDelay);

  pw::StringBuffer<SessionId::kMaxSize> id;
  id.Format("sim-pin-%u", static_cast<unsigned>(next_session_++));

  VerificationSession session;
  session.session_id = *SessionId::FromString(id.view());
  session.sharer_id = sharer_id;
  session.created_at = time_provider_.now();
  session.expires_at = session.created_at + kSessionLifetime;
  session.pin_length = static_cast<uint8_t>(kPin.size());
  session.simulated_pin = PinCode(kPin);
  current_ = session;

  PW_LOG_INFO("Simulated PIN for %.*s is %.*s (session %s)",
              static_cast<int>(sharer_id.value().size()),
              sharer_id.value().data(),
              static_cast<int>(kPin.size()),
              kPin.data(),
              id.c_str());
  co_return session;
}

pw::async2::Coro<pw::Result<bool>> SimulatedPinDeliveryClient::VerifyPin(
    pw::async2::CoroContext& /*cx*/,
    const SessionId& session_id,
    const PinCode& pin) {
  co_await time_provider_.WaitFor(kVerifyDelay);

  if (!current_.has_value() || !(current_->session_id == session_id)) {
    PW_LOG_INFO("Unknown simulated session");
    co_return false;
  }
  if (time_provider_.now() >= current_->expires_at) {
    PW_LOG_INFO("Simulated session expired");
    current_.reset();
    co_return false;
  }
  bool verified = std::string_view(pin) == kPin;
  if (verified) {
    current_.reset();
  }
  co_return verified;
}

}  // namespace steel::pin_delivery
