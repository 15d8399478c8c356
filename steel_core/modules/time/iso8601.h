// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

// UTC timestamps in the ISO-8601 profile used by the Steel backends and
// tag payloads: "YYYY-MM-DDTHH:MM:SSZ", optionally with fractional seconds
// on input ("2026-01-02T03:04:05.678Z").

#include <ctime>
#include <string_view>

#include "pw_chrono/system_clock.h"
#include "pw_result/result.h"
#include "pw_string/string.h"

namespace steel::time {

inline constexpr size_t kIso8601Size = 20;  // "2026-01-02T03:04:05Z"

using Iso8601String = pw::InlineString<kIso8601Size>;

/// Formats a UTC Unix timestamp as "YYYY-MM-DDTHH:MM:SSZ".
Iso8601String FormatIso8601(std::time_t utc);

/// Parses a UTC timestamp. Fractional seconds are accepted and dropped.
/// Returns InvalidArgument for anything that is not a valid UTC instant.
pw::Result<std::time_t> ParseIso8601(std::string_view text);

/// Pairs a wall clock reading with the local monotonic clock at the same
/// instant, so remote wall clock deadlines can be compared against the
/// local time provider.
struct ClockReference {
  std::time_t utc = 0;
  pw::chrono::SystemClock::time_point local;

  /// Local time point corresponding to the given UTC timestamp.
  pw::chrono::SystemClock::time_point ToLocal(std::time_t other_utc) const {
    return local + std::chrono::duration_cast<
                       pw::chrono::SystemClock::duration>(
                       std::chrono::seconds(other_utc - utc));
  }
};

}  // namespace steel::time
