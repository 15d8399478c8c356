// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/pin/pin_tracker.h"

#include "pw_assert/check.h"

namespace steel::pin {

PinTracker::PinTracker(size_t length) : length_(length) {
  PW_CHECK(length > 0 && length <= kMaxPinLength,
           "Invalid PIN length %u",
           static_cast<unsigned>(length));
}

pw::Status PinTracker::Append(uint8_t digit) {
  if (digit > 9) {
    return pw::Status::InvalidArgument();
  }
  if (IsComplete()) {
    return pw::Status::ResourceExhausted();
  }
  digits_[entered_++] = digit;
  return pw::OkStatus();
}

void PinTracker::RemoveLast() {
  if (entered_ > 0) {
    --entered_;
  }
}

void PinTracker::Clear() { entered_ = 0; }

pw::Status PinTracker::Resize(size_t length) {
  if (length == 0 || length > kMaxPinLength) {
    return pw::Status::InvalidArgument();
  }
  length_ = length;
  entered_ = 0;
  return pw::OkStatus();
}

std::optional<uint8_t> PinTracker::digit(size_t index) const {
  if (index >= entered_) {
    return std::nullopt;
  }
  return digits_[index];
}

PinCode PinTracker::AsString() const {
  PinCode code;
  for (size_t i = 0; i < entered_; ++i) {
    code.push_back(static_cast<char>('0' + digits_[i]));
  }
  return code;
}

}  // namespace steel::pin
