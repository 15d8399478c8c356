// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include "etl/message.h"
#include "steel_core/modules/verification/verification_state.h"
#include "steel_core/types.h"

namespace steel::verification::verification_event {

struct Id {
  enum enum_type : etl::message_id_t {
    kScanRequested = 0,
    kTagRead = 1,
    kFlowFailed = 2,
    kPinEntryOpened = 3,
    kVerifyStarted = 4,
    kVerifyAccepted = 5,
    kProfileRevealed = 6,
    kReset = 7,
  };
};

/// A live scan or the scripted simulation was requested.
class ScanRequested : public etl::message<Id::kScanRequested> {};

/// A Steel tag identified its owner.
class TagRead : public etl::message<Id::kTagRead> {
 public:
  explicit TagRead(const MemberId& sharer_id_in) : sharer_id(sharer_id_in) {}
  MemberId sharer_id;
};

/// The flow cannot continue.
class FlowFailed : public etl::message<Id::kFlowFailed> {
 public:
  explicit FlowFailed(VerificationError error_in) : error(error_in) {}
  VerificationError error;
};

/// A PIN was sent to the sharer; the receiver may start typing.
class PinEntryOpened : public etl::message<Id::kPinEntryOpened> {
 public:
  explicit PinEntryOpened(uint8_t pin_length_in) : pin_length(pin_length_in) {}
  uint8_t pin_length;
};

/// The complete PIN was submitted.
class VerifyStarted : public etl::message<Id::kVerifyStarted> {};

/// The PIN matched.
class VerifyAccepted : public etl::message<Id::kVerifyAccepted> {};

/// The full profile arrived.
class ProfileRevealed : public etl::message<Id::kProfileRevealed> {};

/// Abandon the flow and return to Idle.
class Reset : public etl::message<Id::kReset> {};

}  // namespace steel::verification::verification_event
