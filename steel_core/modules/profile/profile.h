// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <optional>

#include "pw_containers/vector.h"
#include "pw_string/string.h"
#include "steel_core/types.h"

namespace steel::profile {

enum class MembershipTier : uint8_t {
  kDigital,  // Digital-only membership
  kSteel,    // Physical card holder
  kElite,    // Wearable and premium perks
};

enum class SocialPlatform : uint8_t {
  kInstagram,
  kLinkedin,
  kTwitter,
  kPhone,
  kEmail,
  kWebsite,
};

inline constexpr size_t kMaxSocialLinks = 6;

struct SocialLink {
  pw::InlineString<16> id;
  SocialPlatform platform = SocialPlatform::kWebsite;
  pw::InlineString<48> handle;
  std::optional<pw::InlineString<96>> url;

  bool operator==(const SocialLink& other) const = default;
};

/// A Steel member's profile.
///
/// Fields below `public_socials` form the private layer. They are only
/// filled in after the sharer approved the connection with a PIN.
struct Profile {
  MemberId id = MemberId::Empty();
  pw::InlineString<64> first_name;
  pw::InlineString<64> last_name;
  pw::InlineString<128> headline;
  std::optional<pw::InlineString<160>> bio;
  std::optional<pw::InlineString<128>> avatar_url;
  MembershipTier tier = MembershipTier::kDigital;
  pw::Vector<SocialLink, kMaxSocialLinks> public_socials;

  std::optional<pw::InlineString<32>> phone;
  std::optional<pw::InlineString<96>> email;
  pw::Vector<SocialLink, kMaxSocialLinks> private_socials;

  /// True if any private-layer field is present.
  bool HasPrivateLayer() const {
    return phone.has_value() || email.has_value() || !private_socials.empty();
  }
};

/// How much of a profile to request.
enum class ProfileLevel : uint8_t {
  kPublic,  // Name, photo, headline, tier and public socials
  kFull,    // Everything; requires a verified PIN session
};

struct ProfileRequest {
  MemberId member_id = MemberId::Empty();
  ProfileLevel level = ProfileLevel::kPublic;
  std::optional<SessionId> session_id;
};

const char* MembershipTierName(MembershipTier tier);    // "steel"
const char* MembershipTierLabel(MembershipTier tier);   // "Steel Member"
const char* SocialPlatformName(SocialPlatform platform);  // "linkedin"

/// Built-in profile revealed by the scripted demo flow.
const Profile& DemoProfile();

}  // namespace steel::profile
