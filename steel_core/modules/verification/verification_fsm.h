// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <optional>

#include "etl/fsm.h"
#include "pw_assert/check.h"
#include "pw_sync/lock_annotations.h"
#include "pw_sync/mutex.h"
#include "steel_core/modules/pin/pin_tracker.h"
#include "steel_core/modules/verification/verification_events.h"
#include "steel_core/modules/verification/verification_observer.h"
#include "steel_core/modules/verification/verification_state.h"
#include "steel_core/types.h"

namespace steel::verification {

inline constexpr etl::message_router_id_t kVerificationFsmId = 2;

class VerificationFsm;

// --- State Classes ---

/// No flow. Entering clears all flow data.
class Idle : public etl::fsm_state<VerificationFsm,
                                   Idle,
                                   VerificationStateId::kIdle,
                                   verification_event::ScanRequested> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::ScanRequested&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Waiting for a tag to be presented.
class Scanning : public etl::fsm_state<VerificationFsm,
                                       Scanning,
                                       VerificationStateId::kScanning,
                                       verification_event::TagRead,
                                       verification_event::FlowFailed,
                                       verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::TagRead& e);
  etl::fsm_state_id_t on_event(const verification_event::FlowFailed& e);
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Sharer known; a PIN is being requested.
class TagDetected : public etl::fsm_state<VerificationFsm,
                                          TagDetected,
                                          VerificationStateId::kTagDetected,
                                          verification_event::PinEntryOpened,
                                          verification_event::FlowFailed,
                                          verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::PinEntryOpened& e);
  etl::fsm_state_id_t on_event(const verification_event::FlowFailed& e);
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Receiver types the PIN the sharer received.
class PinEntry : public etl::fsm_state<VerificationFsm,
                                       PinEntry,
                                       VerificationStateId::kPinEntry,
                                       verification_event::VerifyStarted,
                                       verification_event::FlowFailed,
                                       verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::VerifyStarted&);
  etl::fsm_state_id_t on_event(const verification_event::FlowFailed& e);
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class Verifying : public etl::fsm_state<VerificationFsm,
                                        Verifying,
                                        VerificationStateId::kVerifying,
                                        verification_event::VerifyAccepted,
                                        verification_event::FlowFailed,
                                        verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::VerifyAccepted&);
  etl::fsm_state_id_t on_event(const verification_event::FlowFailed& e);
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// PIN accepted; the full profile is being fetched.
class Verified : public etl::fsm_state<VerificationFsm,
                                       Verified,
                                       VerificationStateId::kVerified,
                                       verification_event::ProfileRevealed,
                                       verification_event::FlowFailed,
                                       verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::ProfileRevealed&);
  etl::fsm_state_id_t on_event(const verification_event::FlowFailed& e);
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class ProfileRevealedState
    : public etl::fsm_state<VerificationFsm,
                            ProfileRevealedState,
                            VerificationStateId::kProfileRevealed,
                            verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class ErrorState : public etl::fsm_state<VerificationFsm,
                                         ErrorState,
                                         VerificationStateId::kError,
                                         verification_event::Reset> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const verification_event::Reset&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// --- VerificationFsm ---
//
// Threading model:
//   receive() and all context fields are used on the dispatcher thread
//   only. Other threads read the flow through GetSnapshot(), which copies
//   a cache refreshed by SyncSnapshot() after every mutation.

class VerificationFsm : public etl::fsm {
 public:
  VerificationFsm();

  // --- Flow data (dispatcher thread only, via get_fsm_context()) ---
  MemberId sharer_id = MemberId::Empty();
  std::optional<VerificationError> error;
  pin::PinTracker pin;

  VerificationStateId::enum_type state() const {
    return static_cast<VerificationStateId::enum_type>(get_state_id());
  }

  VerificationFlowState flow_state() const;

  // --- Observer management ---
  void AddObserver(VerificationObserver* observer);
  void NotifyFlowStateChanged();
  void NotifyPinChanged();

  // --- Snapshot (thread-safe) ---
  void GetSnapshot(VerificationSnapshot& out) const
      PW_LOCKS_EXCLUDED(snapshot_mutex_);

  /// Must be called after receive() or any change to `pin`.
  void SyncSnapshot() PW_LOCKS_EXCLUDED(snapshot_mutex_);

  // --- Used by state classes ---
  etl::fsm_state_id_t EnterError(VerificationError reason);

 private:
  static constexpr size_t kMaxObservers = 4;
  std::array<VerificationObserver*, kMaxObservers> observers_{};
  size_t observer_count_ = 0;

  Idle idle_;
  Scanning scanning_;
  TagDetected tag_detected_;
  PinEntry pin_entry_;
  Verifying verifying_;
  Verified verified_;
  ProfileRevealedState profile_revealed_;
  ErrorState error_;

  etl::ifsm_state* state_list_[VerificationStateId::kNumberOfStates];

  mutable pw::sync::Mutex snapshot_mutex_;
  VerificationSnapshot snapshot_ PW_GUARDED_BY(snapshot_mutex_);
};

}  // namespace steel::verification
