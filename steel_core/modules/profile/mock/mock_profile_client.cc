// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/profile/mock/mock_profile_client.h"

namespace steel::profile {

pw::async2::Coro<pw::Result<Profile>> MockProfileClient::FetchProfile(
    pw::async2::CoroContext& /*cx*/, const ProfileRequest& request) {
  fetch_count_++;
  last_request_ = request;
  if (!deferred_) {
    co_return fetch_result_;
  }
  fetch_pending_ = true;
  pw::Result<Profile> result = co_await fetch_provider_.Get();
  fetch_pending_ = false;
  co_return result;
}

void MockProfileClient::CompleteFetch(pw::Result<Profile> result) {
  if (fetch_pending_) {
    fetch_provider_.Resolve(std::move(result));
  }
}

}  // namespace steel::profile
