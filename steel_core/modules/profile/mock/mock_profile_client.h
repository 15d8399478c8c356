// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <optional>

#include "pw_async2/coro.h"
#include "pw_async2/value_future.h"
#include "pw_result/result.h"
#include "steel_core/modules/profile/profile_client.h"

namespace steel::profile {

/// Mock profile backend for the host demo and unit tests.
///
/// Returns the configured result, by default DemoProfile(). With
/// set_deferred(true) fetches stay pending until CompleteFetch().
class MockProfileClient : public ProfileClient {
 public:
  MockProfileClient() = default;

  pw::async2::Coro<pw::Result<Profile>> FetchProfile(
      pw::async2::CoroContext& cx, const ProfileRequest& request) override;

  // -- Test Helpers --

  void SetFetchResult(pw::Result<Profile> result) {
    fetch_result_ = std::move(result);
  }

  void set_deferred(bool deferred) { deferred_ = deferred; }

  /// Resolves a pending fetch. No-op if none is pending.
  void CompleteFetch(pw::Result<Profile> result);

  bool fetch_pending() const { return fetch_pending_; }
  size_t fetch_count() const { return fetch_count_; }
  const std::optional<ProfileRequest>& last_request() const {
    return last_request_;
  }

 private:
  pw::Result<Profile> fetch_result_ = DemoProfile();
  bool deferred_ = false;
  bool fetch_pending_ = false;
  pw::async2::ValueProvider<pw::Result<Profile>> fetch_provider_;
  size_t fetch_count_ = 0;
  std::optional<ProfileRequest> last_request_;
};

}  // namespace steel::profile
