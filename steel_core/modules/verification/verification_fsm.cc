// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "VRFY"

#include "steel_core/modules/verification/verification_fsm.h"

#include <mutex>

#include "pw_log/log.h"

namespace steel::verification {

// --- VerificationFsm ---

VerificationFsm::VerificationFsm() : etl::fsm(kVerificationFsmId) {
  // Order must match VerificationStateId values
  state_list_[VerificationStateId::kIdle] = &idle_;
  state_list_[VerificationStateId::kScanning] = &scanning_;
  state_list_[VerificationStateId::kTagDetected] = &tag_detected_;
  state_list_[VerificationStateId::kPinEntry] = &pin_entry_;
  state_list_[VerificationStateId::kVerifying] = &verifying_;
  state_list_[VerificationStateId::kVerified] = &verified_;
  state_list_[VerificationStateId::kProfileRevealed] = &profile_revealed_;
  state_list_[VerificationStateId::kError] = &error_;

  set_states(state_list_, VerificationStateId::kNumberOfStates);
  start();
  SyncSnapshot();
}

VerificationFlowState VerificationFsm::flow_state() const {
  VerificationFlowState flow;
  flow.id = state();
  flow.sharer_id = sharer_id;
  flow.error = error;
  return flow;
}

void VerificationFsm::AddObserver(VerificationObserver* observer) {
  PW_CHECK_NOTNULL(observer);
  PW_CHECK(observer_count_ < kMaxObservers,
           "Too many verification observers (max %u)",
           static_cast<unsigned>(kMaxObservers));
  observers_[observer_count_++] = observer;
}

void VerificationFsm::NotifyFlowStateChanged() {
  const VerificationFlowState flow = flow_state();
  for (size_t i = 0; i < observer_count_; ++i) {
    observers_[i]->OnFlowStateChanged(flow);
  }
}

void VerificationFsm::NotifyPinChanged() {
  for (size_t i = 0; i < observer_count_; ++i) {
    observers_[i]->OnPinChanged(pin);
  }
}

void VerificationFsm::SyncSnapshot() {
  std::lock_guard lock(snapshot_mutex_);
  snapshot_.flow = flow_state();
  snapshot_.entered_pin = pin.AsString();
  snapshot_.pin_length = static_cast<uint8_t>(pin.length());
}

void VerificationFsm::GetSnapshot(VerificationSnapshot& out) const {
  std::lock_guard lock(snapshot_mutex_);
  out = snapshot_;
}

etl::fsm_state_id_t VerificationFsm::EnterError(VerificationError reason) {
  error = reason;
  PW_LOG_WARN("Verification failed in %s: %s",
              VerificationStateName(state()),
              VerificationErrorMessage(reason));
  return VerificationStateId::kError;
}

// --- Idle ---

etl::fsm_state_id_t Idle::on_enter_state() {
  auto& ctx = get_fsm_context();
  ctx.sharer_id = MemberId::Empty();
  ctx.error.reset();
  ctx.pin.Clear();
  PW_LOG_INFO("Idle");
  ctx.NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t Idle::on_event(const verification_event::ScanRequested&) {
  return VerificationStateId::kScanning;
}

// --- Scanning ---

etl::fsm_state_id_t Scanning::on_enter_state() {
  PW_LOG_INFO("Scanning for a Steel tag");
  get_fsm_context().NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t Scanning::on_event(const verification_event::TagRead& e) {
  get_fsm_context().sharer_id = e.sharer_id;
  return VerificationStateId::kTagDetected;
}

etl::fsm_state_id_t Scanning::on_event(
    const verification_event::FlowFailed& e) {
  return get_fsm_context().EnterError(e.error);
}

etl::fsm_state_id_t Scanning::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- TagDetected ---

etl::fsm_state_id_t TagDetected::on_enter_state() {
  auto& ctx = get_fsm_context();
  PW_LOG_INFO("Tag of %.*s detected",
              static_cast<int>(ctx.sharer_id.value().size()),
              ctx.sharer_id.value().data());
  ctx.NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t TagDetected::on_event(
    const verification_event::PinEntryOpened& e) {
  auto& ctx = get_fsm_context();
  if (!ctx.pin.Resize(e.pin_length).ok()) {
    PW_LOG_WARN("Unsupported PIN length %u",
                static_cast<unsigned>(e.pin_length));
    return ctx.EnterError(VerificationError::kNetworkError);
  }
  return VerificationStateId::kPinEntry;
}

etl::fsm_state_id_t TagDetected::on_event(
    const verification_event::FlowFailed& e) {
  return get_fsm_context().EnterError(e.error);
}

etl::fsm_state_id_t TagDetected::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- PinEntry ---

etl::fsm_state_id_t PinEntry::on_enter_state() {
  auto& ctx = get_fsm_context();
  PW_LOG_INFO("Waiting for %u-digit PIN",
              static_cast<unsigned>(ctx.pin.length()));
  ctx.NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t PinEntry::on_event(
    const verification_event::VerifyStarted&) {
  return VerificationStateId::kVerifying;
}

etl::fsm_state_id_t PinEntry::on_event(
    const verification_event::FlowFailed& e) {
  return get_fsm_context().EnterError(e.error);
}

etl::fsm_state_id_t PinEntry::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- Verifying ---

etl::fsm_state_id_t Verifying::on_enter_state() {
  PW_LOG_INFO("Verifying PIN");
  get_fsm_context().NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t Verifying::on_event(
    const verification_event::VerifyAccepted&) {
  return VerificationStateId::kVerified;
}

etl::fsm_state_id_t Verifying::on_event(
    const verification_event::FlowFailed& e) {
  return get_fsm_context().EnterError(e.error);
}

etl::fsm_state_id_t Verifying::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- Verified ---

etl::fsm_state_id_t Verified::on_enter_state() {
  PW_LOG_INFO("PIN accepted");
  get_fsm_context().NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t Verified::on_event(
    const verification_event::ProfileRevealed&) {
  return VerificationStateId::kProfileRevealed;
}

etl::fsm_state_id_t Verified::on_event(
    const verification_event::FlowFailed& e) {
  return get_fsm_context().EnterError(e.error);
}

etl::fsm_state_id_t Verified::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- ProfileRevealed ---

etl::fsm_state_id_t ProfileRevealedState::on_enter_state() {
  auto& ctx = get_fsm_context();
  PW_LOG_INFO("Profile of %.*s revealed",
              static_cast<int>(ctx.sharer_id.value().size()),
              ctx.sharer_id.value().data());
  ctx.NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t ProfileRevealedState::on_event(
    const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

// --- Error ---

etl::fsm_state_id_t ErrorState::on_enter_state() {
  get_fsm_context().NotifyFlowStateChanged();
  return No_State_Change;
}

etl::fsm_state_id_t ErrorState::on_event(const verification_event::Reset&) {
  return VerificationStateId::kIdle;
}

}  // namespace steel::verification
