// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>

#include "pw_span/span.h"
#include "steel_core/modules/verification/simulation_schedule.h"

namespace steel::verification {

struct VerificationConfig {
  /// Lifetime of the session created by the scripted flow.
  std::chrono::seconds session_timeout = std::chrono::seconds(120);

  /// Compare a delivered `simulated_pin` locally instead of asking the
  /// PIN delivery backend. Offline demos only.
  bool accept_simulated_pin = false;

  pw::span<const SimulationStep> schedule = kDefaultSimulationSchedule;
};

}  // namespace steel::verification
