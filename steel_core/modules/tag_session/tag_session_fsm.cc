// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "TAGS"

#include "steel_core/modules/tag_session/tag_session_fsm.h"

#include "pw_log/log.h"
#include "steel_core/modules/tag_payload/tag_payload.h"

namespace steel::tag_session {

const char* TagSessionErrorMessage(TagSessionError error) {
  switch (error) {
    case TagSessionError::kNotAvailable:
      return "NFC is not available on this device";
    case TagSessionError::kConnectionFailed:
      return "Failed to connect to tag";
    case TagSessionError::kCapabilityQueryFailed:
      return "Failed to query tag status";
    case TagSessionError::kNotNdefCompatible:
      return "Tag is not NDEF compatible";
    case TagSessionError::kReadOnlyTag:
      return "Tag is read-only";
    case TagSessionError::kReadFailed:
      return "Failed to read tag";
    case TagSessionError::kWriteFailed:
      return "Failed to write to tag";
    case TagSessionError::kEmptyTag:
      return "Tag is empty";
    case TagSessionError::kInvalidTagFormat:
      return "Not a valid Steel tag";
  }
  return "Unknown tag error";
}

// --- TagSessionFsm ---

TagSessionFsm::TagSessionFsm(const TagSessionConfig& config)
    : etl::fsm(kTagSessionFsmId), config_(config) {
  // Order must match TagSessionStateId values
  state_list_[TagSessionStateId::kIdle] = &idle_;
  state_list_[TagSessionStateId::kConnecting] = &connecting_;
  state_list_[TagSessionStateId::kQueryingCapability] = &querying_capability_;
  state_list_[TagSessionStateId::kReadingData] = &reading_data_;
  state_list_[TagSessionStateId::kWritingData] = &writing_data_;
  state_list_[TagSessionStateId::kFinished] = &finished_;

  set_states(state_list_, TagSessionStateId::kNumberOfStates);
  start();
}

void TagSessionFsm::Restart() {
  reset();
  outcome_.reset();
  write_request_.reset();
  multi_tag_retries_ = 0;
  write_size_ = 0;
  start();
}

etl::fsm_state_id_t TagSessionFsm::Finish(TagSessionOutcome outcome) {
  outcome_ = std::move(outcome);
  return TagSessionStateId::kFinished;
}

etl::fsm_state_id_t TagSessionFsm::Fail(TagSessionError error) {
  PW_LOG_WARN("Tag session failed: %s", TagSessionErrorMessage(error));
  return Finish(TagSessionFailure{error});
}

// --- Idle ---

etl::fsm_state_id_t StateIdle::on_event(const MsgStart& msg) {
  auto& ctx = get_fsm_context();
  ctx.mode_ = msg.mode;
  if (!msg.reader_available) {
    return ctx.Fail(TagSessionError::kNotAvailable);
  }
  if (msg.mode == TagSessionMode::kWrite && !ctx.write_request_.has_value()) {
    PW_LOG_ERROR("Write session started without a valid payload");
    return ctx.Fail(TagSessionError::kWriteFailed);
  }
  PW_LOG_INFO("Tag session started (%s)",
              msg.mode == TagSessionMode::kRead ? "read" : "write");
  return TagSessionStateId::kConnecting;
}

// --- Connecting ---

etl::fsm_state_id_t StateConnecting::on_event(const MsgConnected&) {
  return TagSessionStateId::kQueryingCapability;
}

etl::fsm_state_id_t StateConnecting::on_event(const MsgMultipleTags&) {
  auto& ctx = get_fsm_context();
  ctx.multi_tag_retries_++;
  if (ctx.config_.max_multi_tag_retries != 0 &&
      ctx.multi_tag_retries_ > ctx.config_.max_multi_tag_retries) {
    PW_LOG_WARN("Still multiple tags after %u retries",
                static_cast<unsigned>(ctx.config_.max_multi_tag_retries));
    return ctx.Fail(TagSessionError::kConnectionFailed);
  }
  PW_LOG_INFO("Multiple tags in field, polling again");
  return No_State_Change;
}

etl::fsm_state_id_t StateConnecting::on_event(const MsgConnectFailed&) {
  return get_fsm_context().Fail(TagSessionError::kConnectionFailed);
}

etl::fsm_state_id_t StateConnecting::on_event(const MsgCancel&) {
  return get_fsm_context().Finish(TagSessionCancelled{});
}

// --- QueryingCapability ---

etl::fsm_state_id_t StateQueryingCapability::on_event(
    const MsgCapabilityReported& msg) {
  auto& ctx = get_fsm_context();
  switch (msg.capability) {
    case NdefCapability::kNotSupported:
      return ctx.Fail(TagSessionError::kNotNdefCompatible);
    case NdefCapability::kReadOnly:
      if (ctx.mode_ == TagSessionMode::kWrite) {
        return ctx.Fail(TagSessionError::kReadOnlyTag);
      }
      break;
    case NdefCapability::kReadWrite:
      break;
  }
  return ctx.mode_ == TagSessionMode::kRead ? TagSessionStateId::kReadingData
                                            : TagSessionStateId::kWritingData;
}

etl::fsm_state_id_t StateQueryingCapability::on_event(
    const MsgCapabilityQueryFailed&) {
  return get_fsm_context().Fail(TagSessionError::kCapabilityQueryFailed);
}

etl::fsm_state_id_t StateQueryingCapability::on_event(const MsgCancel&) {
  return get_fsm_context().Finish(TagSessionCancelled{});
}

// --- ReadingData ---

etl::fsm_state_id_t StateReadingData::on_event(const MsgDataRead& msg) {
  auto& ctx = get_fsm_context();
  if (msg.data.empty()) {
    return ctx.Fail(TagSessionError::kEmptyTag);
  }

  auto identity = tag_payload::DecodeTagPayload(msg.data);
  if (!identity.ok()) {
    PW_LOG_WARN("Tag payload rejected: %s", identity.status().str());
    return ctx.Fail(TagSessionError::kInvalidTagFormat);
  }
  return ctx.Finish(TagReadSuccess{std::move(*identity)});
}

etl::fsm_state_id_t StateReadingData::on_event(const MsgReadFailed&) {
  return get_fsm_context().Fail(TagSessionError::kReadFailed);
}

etl::fsm_state_id_t StateReadingData::on_event(const MsgCancel&) {
  return get_fsm_context().Finish(TagSessionCancelled{});
}

// --- WritingData ---

etl::fsm_state_id_t StateWritingData::on_enter_state() {
  auto& ctx = get_fsm_context();
  const WriteRequest& request = *ctx.write_request_;
  auto size = tag_payload::EncodeTagPayload(request.member_id,
                                            std::string_view(request.display_name),
                                            request.now_utc,
                                            ctx.write_buffer_);
  if (!size.ok()) {
    PW_LOG_ERROR("Failed to encode tag payload: %s", size.status().str());
    return ctx.Fail(TagSessionError::kWriteFailed);
  }
  ctx.write_size_ = *size;
  return No_State_Change;
}

etl::fsm_state_id_t StateWritingData::on_event(const MsgWriteComplete& msg) {
  auto& ctx = get_fsm_context();
  if (!msg.status.ok()) {
    PW_LOG_WARN("Tag write failed: %s", msg.status.str());
    return ctx.Fail(TagSessionError::kWriteFailed);
  }
  return ctx.Finish(TagWriteSuccess{});
}

etl::fsm_state_id_t StateWritingData::on_event(const MsgCancel&) {
  return get_fsm_context().Finish(TagSessionCancelled{});
}

// --- Finished ---

etl::fsm_state_id_t StateFinished::on_enter_state() {
  const auto& outcome = *get_fsm_context().outcome();
  if (std::holds_alternative<TagSessionCancelled>(outcome)) {
    PW_LOG_INFO("Tag session cancelled");
  } else if (!std::holds_alternative<TagSessionFailure>(outcome)) {
    PW_LOG_INFO("Tag session succeeded");
  }
  return No_State_Change;
}

}  // namespace steel::tag_session
