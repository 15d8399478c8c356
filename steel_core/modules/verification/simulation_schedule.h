// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace steel::verification {

/// What the scripted flow does after a step's delay has elapsed.
enum class SimulationAction : uint8_t {
  kDetectTag,
  kOpenPinEntry,
  kEnterDigit,
  kBeginVerify,
  kConfirmVerified,
  kRevealProfile,
};

const char* SimulationActionName(SimulationAction action);

struct SimulationStep {
  std::chrono::milliseconds delay;
  SimulationAction action;
  uint8_t digit = 0;  // kEnterDigit only
};

inline constexpr std::string_view kSimulatedSharerId = "steel_001";
inline constexpr std::string_view kSimulatedPin = "1234";
inline constexpr std::string_view kSimulatedSessionId = "simulated-session";

// Fixed timeline of the demo flow. Total runtime is 4.9 s.
inline constexpr std::array<SimulationStep, 9> kDefaultSimulationSchedule = {{
    {std::chrono::milliseconds(800), SimulationAction::kDetectTag},
    {std::chrono::milliseconds(500), SimulationAction::kOpenPinEntry},
    {std::chrono::milliseconds(400), SimulationAction::kEnterDigit, 1},
    {std::chrono::milliseconds(400), SimulationAction::kEnterDigit, 2},
    {std::chrono::milliseconds(400), SimulationAction::kEnterDigit, 3},
    {std::chrono::milliseconds(400), SimulationAction::kEnterDigit, 4},
    {std::chrono::milliseconds(300), SimulationAction::kBeginVerify},
    {std::chrono::milliseconds(1200), SimulationAction::kConfirmVerified},
    {std::chrono::milliseconds(500), SimulationAction::kRevealProfile},
}};

}  // namespace steel::verification
