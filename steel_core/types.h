// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

/// @file types.h
/// @brief Domain types shared across the Steel core.
///
/// Identifiers are bounded strings so they can live in coroutine frames,
/// state machine messages and snapshots without heap allocation.
/// Validation happens once, at construction.

#include <cstddef>
#include <string_view>

#include "pw_result/result.h"
#include "pw_string/string.h"

namespace steel {

/// Maximum number of digits a PIN challenge may ask for.
inline constexpr size_t kMaxPinLength = 8;

/// PIN length used when the delivery backend does not say otherwise.
inline constexpr size_t kDefaultPinLength = 4;

/// Entered or expected PIN digits as ASCII text.
using PinCode = pw::InlineString<kMaxPinLength>;

/// Human-readable name carried in the tag's text record.
using DisplayName = pw::InlineString<128>;

/// Identifier of a Steel member (the sharer stored on a tag).
class MemberId {
 public:
  static constexpr size_t kMaxSize = 48;

  /// Create from a string view (must be non-empty and <= 48 characters).
  static pw::Result<MemberId> FromString(std::string_view str) {
    if (str.empty() || str.size() > kMaxSize) {
      return pw::Status::InvalidArgument();
    }
    return MemberId(pw::InlineString<kMaxSize>(str));
  }

  /// Create an empty MemberId (no member known yet).
  static MemberId Empty() { return MemberId(pw::InlineString<kMaxSize>()); }

  std::string_view value() const { return std::string_view(value_); }

  bool empty() const { return value_.empty(); }

  bool operator==(const MemberId& other) const = default;

 private:
  explicit MemberId(pw::InlineString<kMaxSize> value) : value_(value) {}
  pw::InlineString<kMaxSize> value_;
};

/// Opaque identifier of one PIN challenge issued by the delivery backend.
class SessionId {
 public:
  static constexpr size_t kMaxSize = 64;

  /// Create from a string view (must be non-empty and <= 64 characters).
  static pw::Result<SessionId> FromString(std::string_view str) {
    if (str.empty() || str.size() > kMaxSize) {
      return pw::Status::InvalidArgument();
    }
    return SessionId(pw::InlineString<kMaxSize>(str));
  }

  static SessionId Empty() { return SessionId(pw::InlineString<kMaxSize>()); }

  std::string_view value() const { return std::string_view(value_); }

  bool empty() const { return value_.empty(); }

  bool operator==(const SessionId& other) const = default;

 private:
  explicit SessionId(pw::InlineString<kMaxSize> value) : value_(value) {}
  pw::InlineString<kMaxSize> value_;
};

}  // namespace steel
