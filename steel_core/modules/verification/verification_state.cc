// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/verification/verification_state.h"

namespace steel::verification {

const char* VerificationStateName(VerificationStateId::enum_type id) {
  switch (id) {
    case VerificationStateId::kIdle:
      return "idle";
    case VerificationStateId::kScanning:
      return "scanning";
    case VerificationStateId::kTagDetected:
      return "tag-detected";
    case VerificationStateId::kPinEntry:
      return "pin-entry";
    case VerificationStateId::kVerifying:
      return "verifying";
    case VerificationStateId::kVerified:
      return "verified";
    case VerificationStateId::kProfileRevealed:
      return "profile-revealed";
    case VerificationStateId::kError:
      return "error";
    case VerificationStateId::kNumberOfStates:
      break;
  }
  return "unknown";
}

const char* VerificationErrorMessage(VerificationError error) {
  switch (error) {
    case VerificationError::kNfcNotAvailable:
      return "NFC is not available on this device.";
    case VerificationError::kConnectionFailed:
      return "Could not connect to the NFC tag.";
    case VerificationError::kCapabilityQueryFailed:
      return "Could not read tag status.";
    case VerificationError::kNotNdefCompatible:
      return "This tag is not NDEF compatible.";
    case VerificationError::kReadOnlyTag:
      return "This tag is read-only.";
    case VerificationError::kTagReadFailed:
      return "Couldn't read the Steel tag. Try again.";
    case VerificationError::kTagWriteFailed:
      return "Failed to write to the NFC tag.";
    case VerificationError::kEmptyTag:
      return "No data found on tag.";
    case VerificationError::kInvalidTag:
      return "This doesn't appear to be a valid Steel tag.";
    case VerificationError::kPinIncorrect:
      return "Incorrect PIN. Please check with the sharer.";
    case VerificationError::kPinExpired:
      return "Verification timed out. Tap again to retry.";
    case VerificationError::kNetworkError:
      return "Connection error. Please check your network.";
  }
  return "Unknown error";
}

VerificationError ErrorFromTagSession(tag_session::TagSessionError error) {
  using tag_session::TagSessionError;
  switch (error) {
    case TagSessionError::kNotAvailable:
      return VerificationError::kNfcNotAvailable;
    case TagSessionError::kConnectionFailed:
      return VerificationError::kConnectionFailed;
    case TagSessionError::kCapabilityQueryFailed:
      return VerificationError::kCapabilityQueryFailed;
    case TagSessionError::kNotNdefCompatible:
      return VerificationError::kNotNdefCompatible;
    case TagSessionError::kReadOnlyTag:
      return VerificationError::kReadOnlyTag;
    case TagSessionError::kReadFailed:
      return VerificationError::kTagReadFailed;
    case TagSessionError::kWriteFailed:
      return VerificationError::kTagWriteFailed;
    case TagSessionError::kEmptyTag:
      return VerificationError::kEmptyTag;
    case TagSessionError::kInvalidTagFormat:
      return VerificationError::kInvalidTag;
  }
  return VerificationError::kTagReadFailed;
}

}  // namespace steel::verification
