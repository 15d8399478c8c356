// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/profile/profile.h"

namespace steel::profile {
namespace {

SocialLink MakeLink(const char* id,
                    SocialPlatform platform,
                    const char* handle,
                    const char* url = nullptr) {
  SocialLink link;
  link.id = id;
  link.platform = platform;
  link.handle = handle;
  if (url != nullptr) {
    link.url = pw::InlineString<96>(url);
  }
  return link;
}

Profile BuildDemoProfile() {
  Profile profile;
  profile.id = *MemberId::FromString("steel_001");
  profile.first_name = "Alex";
  profile.last_name = "Rivera";
  profile.headline = "Creative Director | NYC";
  profile.bio = pw::InlineString<160>(
      "Building the future of digital identity and curated experiences.");
  profile.avatar_url = pw::InlineString<128>(
      "https://randomuser.me/api/portraits/men/32.jpg");
  profile.tier = MembershipTier::kSteel;
  profile.public_socials.push_back(
      MakeLink("s1", SocialPlatform::kInstagram, "@alex.rivera",
               "https://instagram.com/alex.rivera"));
  profile.public_socials.push_back(
      MakeLink("s2", SocialPlatform::kLinkedin, "LinkedIn",
               "https://linkedin.com/in/alexrivera"));
  profile.public_socials.push_back(
      MakeLink("s3", SocialPlatform::kPhone, "Contact"));
  profile.phone = pw::InlineString<32>("+1 (555) 123-4567");
  profile.email = pw::InlineString<96>("alex@exo.dev");
  profile.private_socials.push_back(
      MakeLink("s4", SocialPlatform::kTwitter, "@alexr_creates",
               "https://twitter.com/alexr_creates"));
  return profile;
}

}  // namespace

const char* MembershipTierName(MembershipTier tier) {
  switch (tier) {
    case MembershipTier::kDigital:
      return "digital";
    case MembershipTier::kSteel:
      return "steel";
    case MembershipTier::kElite:
      return "elite";
  }
  return "digital";
}

const char* MembershipTierLabel(MembershipTier tier) {
  switch (tier) {
    case MembershipTier::kDigital:
      return "Steel Digital";
    case MembershipTier::kSteel:
      return "Steel Member";
    case MembershipTier::kElite:
      return "Steel Elite";
  }
  return "Steel Digital";
}

const char* SocialPlatformName(SocialPlatform platform) {
  switch (platform) {
    case SocialPlatform::kInstagram:
      return "instagram";
    case SocialPlatform::kLinkedin:
      return "linkedin";
    case SocialPlatform::kTwitter:
      return "twitter";
    case SocialPlatform::kPhone:
      return "phone";
    case SocialPlatform::kEmail:
      return "email";
    case SocialPlatform::kWebsite:
      return "website";
  }
  return "website";
}

const Profile& DemoProfile() {
  static const Profile profile = BuildDemoProfile();
  return profile;
}

}  // namespace steel::profile
