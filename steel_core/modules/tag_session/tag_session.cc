// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "TAGS"

#include "steel_core/modules/tag_session/tag_session.h"

#include <variant>

#include "pw_log/log.h"

namespace steel::tag_session {

TagSession::TagSession(
    TagReaderDriver& driver,
    pw::async2::TimeProvider<pw::chrono::SystemClock>& time_provider,
    const TagSessionConfig& config)
    : driver_(driver),
      time_provider_(time_provider),
      config_(config),
      fsm_(config) {}

uint32_t TagSession::Begin(TagSessionMode mode) {
  if (active()) {
    PW_LOG_INFO("Superseding running tag session");
    fsm_.receive(MsgCancel());
    driver_.Invalidate();
  }
  ++generation_;
  fsm_.Restart();
  PW_LOG_DEBUG("Tag session %u begins (%s)",
               static_cast<unsigned>(generation_),
               mode == TagSessionMode::kRead ? "read" : "write");
  return generation_;
}

pw::async2::Coro<pw::Result<TagSessionOutcome>> TagSession::Read(
    pw::async2::CoroContext& cx) {
  uint32_t generation = Begin(TagSessionMode::kRead);
  fsm_.receive(MsgStart(TagSessionMode::kRead, driver_.IsAvailable()));
  return Execute(cx, generation);
}

pw::async2::Coro<pw::Result<TagSessionOutcome>> TagSession::Write(
    pw::async2::CoroContext& cx,
    const MemberId& member_id,
    std::string_view display_name,
    std::time_t now_utc) {
  uint32_t generation = Begin(TagSessionMode::kWrite);
  WriteRequest request;
  if (display_name.size() > request.display_name.max_size()) {
    // Left without a write request, the session fails with WriteFailed.
    PW_LOG_WARN("Display name of %u bytes does not fit on a tag",
                static_cast<unsigned>(display_name.size()));
  } else {
    request.member_id = member_id;
    request.display_name = display_name;
    request.now_utc = now_utc;
    fsm_.SetWriteRequest(request);
  }
  fsm_.receive(MsgStart(TagSessionMode::kWrite, driver_.IsAvailable()));
  return Execute(cx, generation);
}

void TagSession::Cancel() {
  if (!active()) {
    return;
  }
  fsm_.receive(MsgCancel());
  driver_.Invalidate();
}

void TagSession::EndHardwareSession(const TagSessionOutcome& outcome) {
  if (std::holds_alternative<TagSessionCancelled>(outcome)) {
    return;  // Already ended by Cancel() or by the user on the reader.
  }
  if (std::holds_alternative<TagReadSuccess>(outcome)) {
    driver_.SetAlertMessage(kReadSuccessAlert);
  } else if (std::holds_alternative<TagWriteSuccess>(outcome)) {
    driver_.SetAlertMessage(kWriteSuccessAlert);
  } else {
    driver_.SetAlertMessage(TagSessionErrorMessage(
        std::get<TagSessionFailure>(outcome).error));
  }
  driver_.Invalidate();
}

// --- Main loop ---

pw::async2::Coro<pw::Result<TagSessionOutcome>> TagSession::Execute(
    pw::async2::CoroContext& cx, uint32_t generation) {
  while (IsCurrent(generation)) {
    switch (fsm_.state()) {
      case TagSessionStateId::kConnecting: {
        auto tags = co_await driver_.Connect(cx);
        if (!IsCurrent(generation)) {
          break;
        }
        if (!tags.ok()) {
          if (tags.status().IsCancelled()) {
            fsm_.receive(MsgCancel());
          } else {
            PW_LOG_WARN("Connect failed: %s", tags.status().str());
            fsm_.receive(MsgConnectFailed());
          }
        } else if (*tags > 1) {
          fsm_.receive(MsgMultipleTags());
          if (fsm_.state() != TagSessionStateId::kConnecting) {
            break;
          }
          driver_.SetAlertMessage(kMultipleTagsAlert);
          co_await time_provider_.WaitFor(config_.multi_tag_retry_interval);
          if (IsCurrent(generation) &&
              fsm_.state() == TagSessionStateId::kConnecting) {
            driver_.RestartPolling();
          }
        } else {
          fsm_.receive(MsgConnected());
        }
        break;
      }

      case TagSessionStateId::kQueryingCapability: {
        auto capability = co_await driver_.QueryCapability(cx);
        if (!IsCurrent(generation)) {
          break;
        }
        if (!capability.ok()) {
          if (capability.status().IsCancelled()) {
            fsm_.receive(MsgCancel());
          } else {
            PW_LOG_WARN("Capability query failed: %s",
                        capability.status().str());
            fsm_.receive(MsgCapabilityQueryFailed());
          }
        } else {
          fsm_.receive(MsgCapabilityReported(*capability));
        }
        break;
      }

      case TagSessionStateId::kReadingData: {
        auto size = co_await driver_.ReadNdef(cx, read_buffer_);
        if (!IsCurrent(generation)) {
          break;
        }
        if (!size.ok()) {
          if (size.status().IsCancelled()) {
            fsm_.receive(MsgCancel());
          } else {
            PW_LOG_WARN("NDEF read failed: %s", size.status().str());
            fsm_.receive(MsgReadFailed());
          }
        } else {
          fsm_.receive(
              MsgDataRead(pw::ConstByteSpan(read_buffer_.data(), *size)));
        }
        break;
      }

      case TagSessionStateId::kWritingData: {
        auto status = co_await driver_.WriteNdef(cx, fsm_.encoded_payload());
        if (!IsCurrent(generation)) {
          break;
        }
        if (status.IsCancelled()) {
          fsm_.receive(MsgCancel());
        } else {
          fsm_.receive(MsgWriteComplete(status));
        }
        break;
      }

      case TagSessionStateId::kFinished: {
        TagSessionOutcome outcome = *fsm_.outcome();
        EndHardwareSession(outcome);
        co_return outcome;
      }

      default:
        PW_LOG_ERROR("Tag session running in unexpected state %u",
                     static_cast<unsigned>(fsm_.state()));
        co_return pw::Status::FailedPrecondition();
    }
  }

  // A newer Read()/Write() took over the reader.
  co_return TagSessionOutcome(TagSessionCancelled{});
}

}  // namespace steel::tag_session
