// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "pw_status/status.h"
#include "pw_string/string_builder.h"
#include "steel_core/modules/profile/profile.h"

namespace steel::profile {

inline constexpr size_t kMaxProfilePathSize = 160;

/// Writes the request path, e.g. "/profiles/steel_001?level=public".
///
/// @returns InvalidArgument for a full request without a session id,
///          ResourceExhausted if `out` is too small.
pw::Status FormatProfilePath(const ProfileRequest& request,
                             pw::StringBuilder& out);

/// Parses a profile returned by the backend.
///
/// At ProfileLevel::kPublic the private layer is dropped even if the
/// backend sent it. Social links on unknown platforms are skipped.
///
/// @returns DataLoss for invalid JSON, missing required fields, unknown
///          membership tiers or oversized values.
pw::Result<Profile> DecodeProfile(pw::ConstByteSpan body, ProfileLevel level);

}  // namespace steel::profile
