// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "pw_status/status.h"
#include "steel_core/types.h"

namespace steel::pin {

/// Partial entry of a fixed-length numeric PIN.
///
/// Slots fill strictly left to right. The active length is set at
/// construction or by Resize() and never exceeds kMaxPinLength.
class PinTracker {
 public:
  /// PW_CHECKs that 1 <= length <= kMaxPinLength.
  explicit PinTracker(size_t length = kDefaultPinLength);

  /// Fills the first empty slot.
  ///
  /// @returns InvalidArgument for a digit above 9, ResourceExhausted
  ///          (and no change) if every slot is already filled.
  pw::Status Append(uint8_t digit);

  /// Clears the last filled slot. No-op when empty.
  void RemoveLast();

  /// Empties every slot.
  void Clear();

  /// Clears and sets a new active length.
  ///
  /// @returns InvalidArgument if length is 0 or above kMaxPinLength.
  pw::Status Resize(size_t length);

  bool IsComplete() const { return entered_ == length_; }
  bool empty() const { return entered_ == 0; }

  size_t length() const { return length_; }
  size_t entered() const { return entered_; }

  /// Digit in slot `index`, or nullopt if that slot is empty.
  std::optional<uint8_t> digit(size_t index) const;

  /// Filled digits in entry order. Only a full PIN once IsComplete().
  PinCode AsString() const;

 private:
  std::array<uint8_t, kMaxPinLength> digits_{};
  size_t length_;
  size_t entered_ = 0;
};

}  // namespace steel::pin
