// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <chrono>
#include <cstdint>
#include <variant>

#include "pw_chrono/system_clock.h"
#include "steel_core/modules/tag_payload/tag_payload.h"

namespace steel::tag_session {
using namespace std::chrono_literals;

/// What the session does once connected.
enum class TagSessionMode : uint8_t {
  kRead,
  kWrite,
};

/// NDEF support reported by the tag.
enum class NdefCapability : uint8_t {
  kNotSupported,
  kReadOnly,
  kReadWrite,
};

/// Why a session ended without success. Cancellation is not an error and
/// has its own outcome.
enum class TagSessionError : uint8_t {
  kNotAvailable,
  kConnectionFailed,
  kCapabilityQueryFailed,
  kNotNdefCompatible,
  kReadOnlyTag,
  kReadFailed,
  kWriteFailed,
  kEmptyTag,
  kInvalidTagFormat,
};

/// Stable description for logs and reader alert text.
const char* TagSessionErrorMessage(TagSessionError error);

/// Read finished with a Steel identity.
struct TagReadSuccess {
  tag_payload::TagIdentity identity;
};

/// Write finished; the tag now carries the Steel payload.
struct TagWriteSuccess {};

struct TagSessionFailure {
  TagSessionError error;
};

/// Session was invalidated by the caller or by the user on the reader.
struct TagSessionCancelled {};

using TagSessionOutcome = std::variant<TagReadSuccess,
                                       TagWriteSuccess,
                                       TagSessionFailure,
                                       TagSessionCancelled>;

struct TagSessionConfig {
  /// Delay before polling again after more than one tag was presented.
  pw::chrono::SystemClock::duration multi_tag_retry_interval = 500ms;

  /// Maximum multi-tag retries before failing with kConnectionFailed.
  /// 0 retries until a single tag is presented or the session is cancelled.
  uint32_t max_multi_tag_retries = 0;
};

}  // namespace steel::tag_session
