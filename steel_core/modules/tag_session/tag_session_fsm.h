// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <ctime>
#include <optional>

#include "etl/fsm.h"
#include "pw_bytes/span.h"
#include "steel_core/modules/tag_payload/steel_protocol.h"
#include "steel_core/modules/tag_session/tag_session_events.h"
#include "steel_core/modules/tag_session/tag_session_types.h"
#include "steel_core/types.h"

namespace steel::tag_session {

/// State IDs for the TagSession FSM.
enum TagSessionStateId : etl::fsm_state_id_t {
  kIdle = 0,
  kConnecting,
  kQueryingCapability,
  kReadingData,
  kWritingData,
  kFinished,
  kNumberOfStates
};

inline constexpr etl::message_router_id_t kTagSessionFsmId = 1;

/// Payload to put on the tag in write mode.
struct WriteRequest {
  MemberId member_id = MemberId::Empty();
  DisplayName display_name;
  std::time_t now_utc = 0;
};

class TagSessionFsm;

// --- State Classes ---

/// Waiting for an explicit start.
class StateIdle : public etl::fsm_state<TagSessionFsm,
                                        StateIdle,
                                        TagSessionStateId::kIdle,
                                        MsgStart> {
 public:
  etl::fsm_state_id_t on_event(const MsgStart& msg);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Polling for a single tag. Multiple tags keep the session here.
class StateConnecting : public etl::fsm_state<TagSessionFsm,
                                              StateConnecting,
                                              TagSessionStateId::kConnecting,
                                              MsgConnected,
                                              MsgMultipleTags,
                                              MsgConnectFailed,
                                              MsgCancel> {
 public:
  etl::fsm_state_id_t on_event(const MsgConnected&);
  etl::fsm_state_id_t on_event(const MsgMultipleTags&);
  etl::fsm_state_id_t on_event(const MsgConnectFailed&);
  etl::fsm_state_id_t on_event(const MsgCancel&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

class StateQueryingCapability
    : public etl::fsm_state<TagSessionFsm,
                            StateQueryingCapability,
                            TagSessionStateId::kQueryingCapability,
                            MsgCapabilityReported,
                            MsgCapabilityQueryFailed,
                            MsgCancel> {
 public:
  etl::fsm_state_id_t on_event(const MsgCapabilityReported& msg);
  etl::fsm_state_id_t on_event(const MsgCapabilityQueryFailed&);
  etl::fsm_state_id_t on_event(const MsgCancel&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Decodes the NDEF bytes delivered by MsgDataRead.
class StateReadingData : public etl::fsm_state<TagSessionFsm,
                                               StateReadingData,
                                               TagSessionStateId::kReadingData,
                                               MsgDataRead,
                                               MsgReadFailed,
                                               MsgCancel> {
 public:
  etl::fsm_state_id_t on_event(const MsgDataRead& msg);
  etl::fsm_state_id_t on_event(const MsgReadFailed&);
  etl::fsm_state_id_t on_event(const MsgCancel&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Encodes the write request on entry; the owner submits the bytes.
class StateWritingData
    : public etl::fsm_state<TagSessionFsm,
                            StateWritingData,
                            TagSessionStateId::kWritingData,
                            MsgWriteComplete,
                            MsgCancel> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const MsgWriteComplete& msg);
  etl::fsm_state_id_t on_event(const MsgCancel&);
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

/// Terminal. outcome() holds the result; late events are ignored.
class StateFinished : public etl::fsm_state<TagSessionFsm,
                                            StateFinished,
                                            TagSessionStateId::kFinished,
                                            MsgCancel> {
 public:
  etl::fsm_state_id_t on_enter_state();
  etl::fsm_state_id_t on_event(const MsgCancel&) { return No_State_Change; }
  etl::fsm_state_id_t on_event_unknown(const etl::imessage&) {
    return No_State_Change;
  }
};

// --- TagSessionFsm ---
//
// Pure state machine for one reader interaction. It performs no I/O:
// TagSession feeds it driver results and reads back what to do next.

class TagSessionFsm : public etl::fsm {
 public:
  explicit TagSessionFsm(const TagSessionConfig& config = {});

  TagSessionStateId state() const {
    return static_cast<TagSessionStateId>(get_state_id());
  }

  /// Returns to Idle, dropping the previous outcome.
  void Restart();

  /// Must be set before a write-mode MsgStart.
  void SetWriteRequest(const WriteRequest& request) {
    write_request_ = request;
  }

  TagSessionMode mode() const { return mode_; }
  uint32_t multi_tag_retries() const { return multi_tag_retries_; }

  /// Set once the session reached Finished.
  const std::optional<TagSessionOutcome>& outcome() const { return outcome_; }

  /// Encoded NDEF message to submit while in WritingData.
  pw::ConstByteSpan encoded_payload() const {
    return pw::ConstByteSpan(write_buffer_.data(), write_size_);
  }

  // --- Used by state classes ---
  etl::fsm_state_id_t Finish(TagSessionOutcome outcome);
  etl::fsm_state_id_t Fail(TagSessionError error);

 private:
  friend class StateIdle;
  friend class StateConnecting;
  friend class StateQueryingCapability;
  friend class StateWritingData;

  TagSessionConfig config_;
  TagSessionMode mode_ = TagSessionMode::kRead;
  std::optional<WriteRequest> write_request_;
  std::optional<TagSessionOutcome> outcome_;
  uint32_t multi_tag_retries_ = 0;

  std::array<std::byte, tag_payload::kMaxNdefMessageSize> write_buffer_{};
  size_t write_size_ = 0;

  StateIdle idle_;
  StateConnecting connecting_;
  StateQueryingCapability querying_capability_;
  StateReadingData reading_data_;
  StateWritingData writing_data_;
  StateFinished finished_;

  etl::ifsm_state* state_list_[TagSessionStateId::kNumberOfStates];
};

}  // namespace steel::tag_session
