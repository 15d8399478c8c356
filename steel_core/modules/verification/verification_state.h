// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>

#include "etl/fsm.h"
#include "steel_core/modules/tag_session/tag_session_types.h"
#include "steel_core/types.h"

namespace steel::verification {

// --- State IDs ---

struct VerificationStateId {
  enum enum_type : etl::fsm_state_id_t {
    kIdle = 0,
    kScanning = 1,
    kTagDetected = 2,
    kPinEntry = 3,
    kVerifying = 4,
    kVerified = 5,
    kProfileRevealed = 6,  // Terminal
    kError = 7,            // Terminal
    kNumberOfStates = 8,
  };
};

const char* VerificationStateName(VerificationStateId::enum_type id);

// --- Error reasons ---

enum class VerificationError : uint8_t {
  kNfcNotAvailable,
  kConnectionFailed,
  kCapabilityQueryFailed,
  kNotNdefCompatible,
  kReadOnlyTag,
  kTagReadFailed,
  kTagWriteFailed,
  kEmptyTag,
  kInvalidTag,
  kPinIncorrect,
  kPinExpired,
  kNetworkError,
};

/// User-facing message for an error reason. Stable across releases.
const char* VerificationErrorMessage(VerificationError error);

/// Maps a failed tag session to the reason shown to the user.
VerificationError ErrorFromTagSession(tag_session::TagSessionError error);

// --- Published state ---

/// What observers see of the flow after each transition.
struct VerificationFlowState {
  VerificationStateId::enum_type id = VerificationStateId::kIdle;
  /// Set from TagDetected on, empty in Idle and Scanning.
  MemberId sharer_id = MemberId::Empty();
  /// Only set in kError.
  std::optional<VerificationError> error;

  bool operator==(const VerificationFlowState& other) const = default;
};

/// Thread-safe copy of the flow for readers outside the dispatcher thread.
struct VerificationSnapshot {
  VerificationFlowState flow;
  PinCode entered_pin;
  uint8_t pin_length = kDefaultPinLength;
};

}  // namespace steel::verification
