// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include "pw_async2/coro.h"
#include "pw_result/result.h"
#include "steel_core/modules/profile/profile.h"

namespace steel::profile {

/// Profile storage backend.
///
///   GET /profiles/{id}?level=public
///   GET /profiles/{id}?level=full&session={session_id}
///
/// The backend nulls the private layer at level=public.
class ProfileClient {
 public:
  virtual ~ProfileClient() = default;

  /// @return NotFound for an unknown member, other errors for transport
  ///         or decoding failures
  virtual pw::async2::Coro<pw::Result<Profile>> FetchProfile(
      pw::async2::CoroContext& cx, const ProfileRequest& request) = 0;
};

}  // namespace steel::profile
