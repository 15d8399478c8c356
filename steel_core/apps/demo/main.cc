// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "MAIN"

#include <chrono>

#include "pw_allocator/libc_allocator.h"
#include "pw_async2/basic_dispatcher.h"
#include "pw_async2/system_time_provider.h"
#include "pw_log/log.h"
#include "pw_thread/sleep.h"
#include "steel_core/modules/feedback/logging_feedback_sink.h"
#include "steel_core/modules/pin_delivery/simulated_pin_delivery_client.h"
#include "steel_core/modules/profile/mock/mock_profile_client.h"
#include "steel_core/modules/profile/profile.h"
#include "steel_core/modules/tag_session/mock/mock_tag_reader_driver.h"
#include "steel_core/modules/tag_session/tag_session.h"
#include "steel_core/modules/verification/verification_orchestrator.h"

namespace {

using namespace std::chrono_literals;
using steel::verification::VerificationFlowState;
using steel::verification::VerificationStateId;

constexpr auto kPollInterval = 10ms;

class TransitionLogger : public steel::verification::VerificationObserver {
 public:
  void OnFlowStateChanged(const VerificationFlowState& state) override {
    last_ = state.id;
    if (state.error.has_value()) {
      PW_LOG_INFO("-> %s: %s",
                  steel::verification::VerificationStateName(state.id),
                  steel::verification::VerificationErrorMessage(*state.error));
      return;
    }
    PW_LOG_INFO("-> %s", steel::verification::VerificationStateName(state.id));
  }

  void OnPinChanged(const steel::pin::PinTracker& pin) override {
    PW_LOG_INFO("   PIN %u/%u",
                static_cast<unsigned>(pin.entered()),
                static_cast<unsigned>(pin.length()));
  }

  bool finished() const {
    return last_ == VerificationStateId::kProfileRevealed ||
           last_ == VerificationStateId::kError;
  }

 private:
  VerificationStateId::enum_type last_ = VerificationStateId::kIdle;
};

void LogProfile(const steel::profile::Profile& profile) {
  PW_LOG_INFO("%s %s (%s)",
              profile.first_name.c_str(),
              profile.last_name.c_str(),
              steel::profile::MembershipTierLabel(profile.tier));
  PW_LOG_INFO("  %s", profile.headline.c_str());
  if (profile.email.has_value()) {
    PW_LOG_INFO("  email: %s", profile.email->c_str());
  }
  if (profile.phone.has_value()) {
    PW_LOG_INFO("  phone: %s", profile.phone->c_str());
  }
  for (const auto& link : profile.public_socials) {
    PW_LOG_INFO("  %s: %s",
                steel::profile::SocialPlatformName(link.platform),
                link.handle.c_str());
  }
  for (const auto& link : profile.private_socials) {
    PW_LOG_INFO("  %s: %s (private)",
                steel::profile::SocialPlatformName(link.platform),
                link.handle.c_str());
  }
}

}  // namespace

int main() {
  PW_LOG_INFO("Steel proximity exchange demo");

  pw::async2::BasicDispatcher dispatcher;
  auto& time_provider = pw::async2::GetSystemTimeProvider();

  steel::tag_session::MockTagReaderDriver driver;
  steel::tag_session::TagSession tag_session(driver, time_provider);
  steel::pin_delivery::SimulatedPinDeliveryClient pin_delivery(time_provider);
  steel::profile::MockProfileClient profile_client;
  steel::feedback::LoggingFeedbackSink feedback;

  steel::verification::VerificationOrchestrator orchestrator(
      tag_session,
      pin_delivery,
      profile_client,
      feedback,
      time_provider,
      pw::allocator::GetLibCAllocator());

  TransitionLogger logger;
  orchestrator.AddObserver(&logger);
  orchestrator.Start(dispatcher);

  orchestrator.StartSimulation();
  while (!logger.finished()) {
    dispatcher.RunUntilStalled();
    pw::this_thread::sleep_for(kPollInterval);
  }

  if (!orchestrator.revealed_profile().has_value()) {
    PW_LOG_ERROR("Demo ended without a profile");
    return 1;
  }
  LogProfile(*orchestrator.revealed_profile());
  orchestrator.Reset();
  return 0;
}
