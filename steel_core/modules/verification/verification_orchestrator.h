// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>

#include "pw_allocator/allocator.h"
#include "pw_async2/coro.h"
#include "pw_async2/coro_or_else_task.h"
#include "pw_async2/dispatcher.h"
#include "pw_async2/time_provider.h"
#include "pw_async2/value_future.h"
#include "pw_chrono/system_clock.h"
#include "pw_status/status.h"
#include "steel_core/modules/feedback/feedback_sink.h"
#include "steel_core/modules/pin/pin_tracker.h"
#include "steel_core/modules/pin_delivery/pin_delivery_client.h"
#include "steel_core/modules/profile/profile.h"
#include "steel_core/modules/profile/profile_client.h"
#include "steel_core/modules/tag_session/tag_session.h"
#include "steel_core/modules/verification/verification_config.h"
#include "steel_core/modules/verification/verification_fsm.h"
#include "steel_core/modules/verification/verification_observer.h"
#include "steel_core/modules/verification/verification_state.h"

namespace steel::verification {

/// Sequences one proximity identity exchange:
///
/// 1. Reads the sharer's Steel tag (or pretends to, in the scripted flow)
/// 2. Requests a PIN for the sharer from the PIN delivery backend
/// 3. Collects the PIN typed by the receiver
/// 4. Checks the PIN and its expiry
/// 5. Fetches and publishes the sharer's full profile
///
/// All methods must be called on the dispatcher thread, except
/// GetSnapshot(). Starting a flow resets the previous one.
class VerificationOrchestrator {
 public:
  VerificationOrchestrator(
      tag_session::TagSession& tag_session,
      pin_delivery::PinDeliveryClient& pin_delivery,
      profile::ProfileClient& profile_client,
      feedback::FeedbackSink& feedback,
      pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider,
      pw::allocator::Allocator& allocator,
      const VerificationConfig& config = {});

  ~VerificationOrchestrator();

  /// Register an observer. Max 4, PW_CHECK on overflow.
  void AddObserver(VerificationObserver* observer) {
    fsm_.AddObserver(observer);
  }

  /// Binds the orchestrator to the dispatcher its flows run on. Must be
  /// called before the first flow is requested.
  void Start(pw::async2::Dispatcher& dispatcher) { dispatcher_ = &dispatcher; }

  /// Starts the live flow: tag read, PIN round trip, profile fetch.
  void StartScan() { RequestFlow(FlowKind::kLive); }

  /// Starts the scripted flow with the configured schedule.
  void StartSimulation() { RequestFlow(FlowKind::kSimulated); }

  /// Appends a digit while the PIN is being entered. Completing the PIN
  /// submits it.
  /// @return FailedPrecondition outside PinEntry or after submission,
  ///         InvalidArgument for digits above 9
  pw::Status EnterDigit(uint8_t digit);

  /// @return FailedPrecondition outside PinEntry or after submission
  pw::Status RemoveDigit();

  /// Abandons the running flow and returns to Idle. The flow's task is
  /// destroyed, so pending collaborator results are dropped unseen.
  /// Must not be called from an observer callback.
  void Reset();

  VerificationFlowState flow_state() const { return fsm_.flow_state(); }
  const pin::PinTracker& pin() const { return fsm_.pin; }

  /// Thread-safe.
  void GetSnapshot(VerificationSnapshot& out) const { fsm_.GetSnapshot(out); }

  /// The challenge in progress, if any.
  const std::optional<pin_delivery::VerificationSession>& session() const {
    return session_;
  }

  /// Set once the flow reaches ProfileRevealed.
  const std::optional<profile::Profile>& revealed_profile() const {
    return revealed_profile_;
  }

 private:
  enum class FlowKind : uint8_t { kLive, kSimulated };

  void RequestFlow(FlowKind kind);

  // Clears all flow data and returns the FSM to Idle. Leaves the flow task
  // alone, so it is safe to call from inside the flow.
  void ResetFlowState();

  void DestroyFlowTask();

  pw::async2::Coro<pw::Status> RunLiveFlow(pw::async2::CoroContext& cx,
                                           uint32_t generation);
  pw::async2::Coro<pw::Status> RunSimulatedFlow(pw::async2::CoroContext& cx,
                                                uint32_t generation);
  pw::async2::Coro<pw::Status> VerifyAndReveal(pw::async2::CoroContext& cx,
                                               uint32_t generation);

  // Flow steps shared by both paths.
  void DetectTag(const MemberId& sharer_id);
  void OpenPinEntry(const pin_delivery::VerificationSession& session);
  void AcceptPin();
  void RejectPin(VerificationError reason);
  void Reveal(const profile::Profile& profile);
  void Fail(VerificationError reason);

  bool IsExpired(const pin_delivery::VerificationSession& session) const {
    return time_provider_.now() >= session.expires_at;
  }

  bool IsCurrent(uint32_t generation) const {
    return generation == generation_;
  }

  tag_session::TagSession& tag_session_;
  pin_delivery::PinDeliveryClient& pin_delivery_;
  profile::ProfileClient& profile_client_;
  feedback::FeedbackSink& feedback_;
  pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider_;
  VerificationConfig config_;

  VerificationFsm fsm_;
  uint32_t generation_ = 0;

  std::optional<pin_delivery::VerificationSession> session_;
  std::optional<profile::Profile> revealed_profile_;

  // The live flow suspends on pin_complete_provider_ until the PIN is
  // complete. submit_fired_ makes the submission happen once per PinEntry.
  bool awaiting_pin_ = false;
  bool submit_fired_ = false;
  pw::async2::ValueProvider<bool> pin_complete_provider_;

  // Each flow runs as its own task. Starting or resetting a flow destroys
  // the previous one wherever it is suspended.
  pw::async2::Dispatcher* dispatcher_ = nullptr;
  pw::async2::CoroContext coro_cx_;
  std::optional<pw::async2::CoroOrElseTask> flow_task_;
};

}  // namespace steel::verification
