// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/verification/simulation_schedule.h"

namespace steel::verification {

const char* SimulationActionName(SimulationAction action) {
  switch (action) {
    case SimulationAction::kDetectTag:
      return "detect-tag";
    case SimulationAction::kOpenPinEntry:
      return "open-pin-entry";
    case SimulationAction::kEnterDigit:
      return "enter-digit";
    case SimulationAction::kBeginVerify:
      return "begin-verify";
    case SimulationAction::kConfirmVerified:
      return "confirm-verified";
    case SimulationAction::kRevealProfile:
      return "reveal-profile";
  }
  return "unknown";
}

}  // namespace steel::verification
