// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include "steel_core/modules/pin/pin_tracker.h"
#include "steel_core/modules/verification/verification_state.h"

namespace steel::verification {

/// Receives verification flow updates on the dispatcher thread.
class VerificationObserver {
 public:
  virtual ~VerificationObserver() = default;

  /// Called after every state transition, including into Idle.
  virtual void OnFlowStateChanged(const VerificationFlowState& state) = 0;

  /// Called when digits are entered, removed or cleared.
  virtual void OnPinChanged(const pin::PinTracker& /*pin*/) {}
};

}  // namespace steel::verification
