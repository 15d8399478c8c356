// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "VRFY"

#include "steel_core/modules/verification/verification_orchestrator.h"

#include <string_view>
#include <variant>

#include "pw_assert/check.h"
#include "pw_log/log.h"
#include "pw_status/try.h"

namespace steel::verification {

VerificationOrchestrator::VerificationOrchestrator(
    tag_session::TagSession& tag_session,
    pin_delivery::PinDeliveryClient& pin_delivery,
    profile::ProfileClient& profile_client,
    feedback::FeedbackSink& feedback,
    pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider,
    pw::allocator::Allocator& allocator,
    const VerificationConfig& config)
    : tag_session_(tag_session),
      pin_delivery_(pin_delivery),
      profile_client_(profile_client),
      feedback_(feedback),
      time_provider_(time_provider),
      config_(config),
      coro_cx_(allocator) {}

VerificationOrchestrator::~VerificationOrchestrator() { DestroyFlowTask(); }

// --- Requests from the presentation layer ---

void VerificationOrchestrator::RequestFlow(FlowKind kind) {
  PW_CHECK_NOTNULL(dispatcher_, "Start() must be called before a flow");
  Reset();
  fsm_.receive(verification_event::ScanRequested());
  fsm_.SyncSnapshot();

  auto coro = kind == FlowKind::kLive ? RunLiveFlow(coro_cx_, generation_)
                                      : RunSimulatedFlow(coro_cx_, generation_);
  flow_task_.emplace(std::move(coro), [](pw::Status s) {
    PW_LOG_ERROR("Verification flow aborted: %s", s.str());
  });
  dispatcher_->Post(*flow_task_);
}

pw::Status VerificationOrchestrator::EnterDigit(uint8_t digit) {
  if (fsm_.state() != VerificationStateId::kPinEntry || submit_fired_) {
    return pw::Status::FailedPrecondition();
  }
  PW_TRY(fsm_.pin.Append(digit));
  feedback_.Play(feedback::FeedbackEvent::kPinDigitEntered);
  fsm_.NotifyPinChanged();
  fsm_.SyncSnapshot();

  if (fsm_.pin.IsComplete()) {
    submit_fired_ = true;
    if (awaiting_pin_) {
      awaiting_pin_ = false;
      pin_complete_provider_.Resolve(true);
    }
  }
  return pw::OkStatus();
}

pw::Status VerificationOrchestrator::RemoveDigit() {
  if (fsm_.state() != VerificationStateId::kPinEntry || submit_fired_) {
    return pw::Status::FailedPrecondition();
  }
  if (fsm_.pin.empty()) {
    return pw::OkStatus();
  }
  fsm_.pin.RemoveLast();
  fsm_.NotifyPinChanged();
  fsm_.SyncSnapshot();
  return pw::OkStatus();
}

void VerificationOrchestrator::Reset() {
  ResetFlowState();
  DestroyFlowTask();
}

void VerificationOrchestrator::ResetFlowState() {
  ++generation_;
  tag_session_.Cancel();

  submit_fired_ = false;
  if (awaiting_pin_) {
    awaiting_pin_ = false;
    pin_complete_provider_.Resolve(false);
  }
  session_.reset();
  revealed_profile_.reset();

  const bool had_digits = !fsm_.pin.empty();
  if (fsm_.state() != VerificationStateId::kIdle) {
    fsm_.receive(verification_event::Reset());
  }
  if (had_digits) {
    fsm_.NotifyPinChanged();
  }
  fsm_.SyncSnapshot();
}

void VerificationOrchestrator::DestroyFlowTask() {
  if (!flow_task_.has_value()) {
    return;
  }
  if (flow_task_->IsRegistered()) {
    flow_task_->Deregister();
  }
  flow_task_.reset();
}

// --- Flow steps ---

void VerificationOrchestrator::DetectTag(const MemberId& sharer_id) {
  fsm_.receive(verification_event::TagRead(sharer_id));
  feedback_.Play(feedback::FeedbackEvent::kTagDetected);
  fsm_.SyncSnapshot();
}

void VerificationOrchestrator::OpenPinEntry(
    const pin_delivery::VerificationSession& session) {
  session_ = session;
  submit_fired_ = false;
  fsm_.receive(verification_event::PinEntryOpened(session.pin_length));
  if (fsm_.state() != VerificationStateId::kPinEntry) {
    session_.reset();
  }
  fsm_.NotifyPinChanged();
  fsm_.SyncSnapshot();
}

void VerificationOrchestrator::AcceptPin() {
  fsm_.receive(verification_event::VerifyAccepted());
  feedback_.Play(feedback::FeedbackEvent::kPinCorrect);
  fsm_.SyncSnapshot();
}

void VerificationOrchestrator::RejectPin(VerificationError reason) {
  feedback_.Play(feedback::FeedbackEvent::kPinIncorrect);
  Fail(reason);
}

void VerificationOrchestrator::Reveal(const profile::Profile& profile) {
  revealed_profile_ = profile;
  session_.reset();
  fsm_.receive(verification_event::ProfileRevealed());
  feedback_.Play(feedback::FeedbackEvent::kProfileRevealed);
  fsm_.SyncSnapshot();
}

void VerificationOrchestrator::Fail(VerificationError reason) {
  session_.reset();
  if (!fsm_.pin.empty()) {
    fsm_.pin.Clear();
    fsm_.NotifyPinChanged();
  }
  fsm_.receive(verification_event::FlowFailed(reason));
  fsm_.SyncSnapshot();
}

// --- Flows ---

pw::async2::Coro<pw::Status> VerificationOrchestrator::RunLiveFlow(
    pw::async2::CoroContext& cx, uint32_t generation) {
  auto outcome = co_await tag_session_.Read(cx);
  if (!IsCurrent(generation)) {
    co_return pw::OkStatus();
  }
  if (!outcome.ok()) {
    Fail(VerificationError::kTagReadFailed);
    co_return outcome.status();
  }
  if (std::holds_alternative<tag_session::TagSessionCancelled>(*outcome)) {
    PW_LOG_INFO("Tag read cancelled");
    ResetFlowState();
    co_return pw::OkStatus();
  }
  if (const auto* failure =
          std::get_if<tag_session::TagSessionFailure>(&*outcome)) {
    Fail(ErrorFromTagSession(failure->error));
    co_return pw::OkStatus();
  }
  const auto* success = std::get_if<tag_session::TagReadSuccess>(&*outcome);
  if (success == nullptr) {
    Fail(VerificationError::kTagReadFailed);
    co_return pw::Status::Internal();
  }

  const MemberId sharer_id = success->identity.member_id;
  DetectTag(sharer_id);

  auto session = co_await pin_delivery_.SendPin(cx, sharer_id);
  if (!IsCurrent(generation)) {
    co_return pw::OkStatus();
  }
  if (!session.ok()) {
    PW_LOG_WARN("PIN request failed: %s", session.status().str());
    Fail(VerificationError::kNetworkError);
    co_return pw::OkStatus();
  }
  OpenPinEntry(*session);
  if (fsm_.state() != VerificationStateId::kPinEntry) {
    co_return pw::OkStatus();
  }

  if (!submit_fired_) {
    awaiting_pin_ = true;
    const bool submitted = co_await pin_complete_provider_.Get();
    if (!submitted) {
      PW_LOG_DEBUG("PIN entry abandoned");
    }
  }
  if (!IsCurrent(generation)) {
    co_return pw::OkStatus();
  }
  co_return co_await VerifyAndReveal(cx, generation);
}

pw::async2::Coro<pw::Status> VerificationOrchestrator::VerifyAndReveal(
    pw::async2::CoroContext& cx, uint32_t generation) {
  if (!session_.has_value()) {
    co_return pw::Status::FailedPrecondition();
  }
  fsm_.receive(verification_event::VerifyStarted());
  fsm_.SyncSnapshot();

  const pin_delivery::VerificationSession session = *session_;
  const PinCode pin = fsm_.pin.AsString();

  if (IsExpired(session)) {
    PW_LOG_INFO("PIN submitted after session expiry");
    RejectPin(VerificationError::kPinExpired);
    co_return pw::OkStatus();
  }

  bool matched = false;
  if (session.simulated_pin.has_value() && config_.accept_simulated_pin) {
    matched = std::string_view(*session.simulated_pin) == std::string_view(pin);
  } else {
    if (session.simulated_pin.has_value()) {
      PW_LOG_WARN("Ignoring simulated PIN, verifying with backend");
    }
    auto verified =
        co_await pin_delivery_.VerifyPin(cx, session.session_id, pin);
    if (!IsCurrent(generation)) {
      co_return pw::OkStatus();
    }
    if (!verified.ok()) {
      PW_LOG_WARN("PIN verification failed: %s", verified.status().str());
      Fail(VerificationError::kNetworkError);
      co_return pw::OkStatus();
    }
    matched = *verified;
  }

  if (!matched) {
    RejectPin(VerificationError::kPinIncorrect);
    co_return pw::OkStatus();
  }
  AcceptPin();

  profile::ProfileRequest request;
  request.member_id = fsm_.sharer_id;
  request.level = profile::ProfileLevel::kFull;
  request.session_id = session.session_id;
  auto profile = co_await profile_client_.FetchProfile(cx, request);
  if (!IsCurrent(generation)) {
    co_return pw::OkStatus();
  }
  if (!profile.ok()) {
    PW_LOG_WARN("Profile fetch failed: %s", profile.status().str());
    Fail(VerificationError::kNetworkError);
    co_return pw::OkStatus();
  }
  Reveal(*profile);
  co_return pw::OkStatus();
}

pw::async2::Coro<pw::Status> VerificationOrchestrator::RunSimulatedFlow(
    pw::async2::CoroContext& /*cx*/, uint32_t generation) {
  PW_LOG_INFO("Running scripted flow (%u steps)",
              static_cast<unsigned>(config_.schedule.size()));

  for (const SimulationStep& step : config_.schedule) {
    co_await time_provider_.WaitFor(step.delay);
    if (!IsCurrent(generation)) {
      PW_LOG_DEBUG("Scripted flow superseded");
      co_return pw::OkStatus();
    }
    PW_LOG_DEBUG("Scripted step: %s", SimulationActionName(step.action));

    switch (step.action) {
      case SimulationAction::kDetectTag: {
        PW_CO_TRY_ASSIGN(MemberId sharer_id,
                         MemberId::FromString(kSimulatedSharerId));
        DetectTag(sharer_id);
        break;
      }

      case SimulationAction::kOpenPinEntry: {
        pin_delivery::VerificationSession session;
        PW_CO_TRY_ASSIGN(session.session_id,
                         SessionId::FromString(kSimulatedSessionId));
        session.sharer_id = fsm_.sharer_id;
        session.created_at = time_provider_.now();
        session.expires_at = session.created_at + config_.session_timeout;
        session.pin_length = static_cast<uint8_t>(kSimulatedPin.size());
        session.simulated_pin = PinCode(kSimulatedPin);
        OpenPinEntry(session);
        break;
      }

      case SimulationAction::kEnterDigit: {
        pw::Status status = EnterDigit(step.digit);
        if (!status.ok()) {
          PW_LOG_DEBUG("Scripted digit ignored: %s", status.str());
        }
        break;
      }

      case SimulationAction::kBeginVerify:
        fsm_.receive(verification_event::VerifyStarted());
        fsm_.SyncSnapshot();
        break;

      case SimulationAction::kConfirmVerified: {
        if (fsm_.state() != VerificationStateId::kVerifying ||
            !session_.has_value()) {
          break;
        }
        if (IsExpired(*session_)) {
          RejectPin(VerificationError::kPinExpired);
        } else if (std::string_view(fsm_.pin.AsString()) == kSimulatedPin) {
          AcceptPin();
        } else {
          RejectPin(VerificationError::kPinIncorrect);
        }
        break;
      }

      case SimulationAction::kRevealProfile:
        if (fsm_.state() == VerificationStateId::kVerified) {
          Reveal(profile::DemoProfile());
        }
        break;
    }

    if (fsm_.state() == VerificationStateId::kError) {
      co_return pw::OkStatus();
    }
  }
  co_return pw::OkStatus();
}

}  // namespace steel::verification
