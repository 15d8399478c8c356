// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <string_view>

namespace steel::tag_payload {

/// External record type identifying a Steel connect payload.
inline constexpr std::string_view kExternalType = "com.exo.steel:connect";

/// Web address written into the URI record; the member id is appended.
inline constexpr std::string_view kFallbackUrlPrefix =
    "https://steel.byexo.com/connect/";

/// Path segment that precedes the member id in a fallback URI.
inline constexpr std::string_view kConnectSegment = "connect";

inline constexpr std::string_view kPayloadVersion = "1.0";
inline constexpr std::string_view kDefaultLanguage = "en";

// JSON keys of the external record payload.
inline constexpr const char* kMemberIdKey = "memberId";
inline constexpr const char* kTimestampKey = "timestamp";
inline constexpr const char* kVersionKey = "version";

/// Largest NDEF message read from or written to a Steel tag.
inline constexpr size_t kMaxNdefMessageSize = 512;

}  // namespace steel::tag_payload
