// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "PROF"

#include "steel_core/modules/profile/profile_codec.h"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <utility>

#include "nlohmann/json.hpp"
#include "pw_log/log.h"
#include "pw_status/try.h"

namespace steel::profile {
namespace {

using nlohmann::json;

constexpr std::array<std::pair<std::string_view, MembershipTier>, 3> kTiers = {{
    {"digital", MembershipTier::kDigital},
    {"steel", MembershipTier::kSteel},
    {"elite", MembershipTier::kElite},
}};

constexpr std::array<std::pair<std::string_view, SocialPlatform>, 6>
    kPlatforms = {{
        {"instagram", SocialPlatform::kInstagram},
        {"linkedin", SocialPlatform::kLinkedin},
        {"twitter", SocialPlatform::kTwitter},
        {"phone", SocialPlatform::kPhone},
        {"email", SocialPlatform::kEmail},
        {"website", SocialPlatform::kWebsite},
    }};

const json* Find(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

template <size_t kCapacity>
pw::Status ReadString(const json& object,
                      const char* key,
                      pw::InlineString<kCapacity>& out) {
  const json* value = Find(object, key);
  if (value == nullptr || !value->is_string()) {
    PW_LOG_WARN("Profile field '%s' missing or not a string", key);
    return pw::Status::DataLoss();
  }
  const std::string& text = value->get_ref<const std::string&>();
  if (text.size() > kCapacity) {
    PW_LOG_WARN("Profile field '%s' too long (%u)", key,
                static_cast<unsigned>(text.size()));
    return pw::Status::DataLoss();
  }
  out = std::string_view(text);
  return pw::OkStatus();
}

template <size_t kCapacity>
pw::Status ReadOptionalString(
    const json& object,
    const char* key,
    std::optional<pw::InlineString<kCapacity>>& out) {
  out.reset();
  if (Find(object, key) == nullptr) {
    return pw::OkStatus();
  }
  pw::InlineString<kCapacity> value;
  PW_TRY(ReadString(object, key, value));
  out = value;
  return pw::OkStatus();
}

pw::Status ReadSocials(const json& object,
                       const char* key,
                       pw::Vector<SocialLink, kMaxSocialLinks>& out) {
  const json* list = Find(object, key);
  if (list == nullptr) {
    return pw::OkStatus();
  }
  if (!list->is_array()) {
    return pw::Status::DataLoss();
  }

  for (const json& entry : *list) {
    if (!entry.is_object()) {
      return pw::Status::DataLoss();
    }
    pw::InlineString<16> platform_name;
    PW_TRY(ReadString(entry, "platform", platform_name));
    auto platform = std::find_if(
        kPlatforms.begin(), kPlatforms.end(), [&](const auto& known) {
          return known.first == std::string_view(platform_name);
        });
    if (platform == kPlatforms.end()) {
      PW_LOG_DEBUG("Skipping link on unknown platform %s",
                   platform_name.c_str());
      continue;
    }
    if (out.full()) {
      PW_LOG_WARN("Too many links in '%s', dropping the rest", key);
      break;
    }

    SocialLink link;
    link.platform = platform->second;
    PW_TRY(ReadString(entry, "handle", link.handle));
    if (Find(entry, "id") != nullptr) {
      PW_TRY(ReadString(entry, "id", link.id));
    }
    PW_TRY(ReadOptionalString(entry, "url", link.url));
    out.push_back(link);
  }
  return pw::OkStatus();
}

pw::Status ReadProfile(const json& object, ProfileLevel level, Profile& out) {
  pw::InlineString<MemberId::kMaxSize> id;
  PW_TRY(ReadString(object, "id", id));
  PW_TRY_ASSIGN(out.id, MemberId::FromString(std::string_view(id)));

  PW_TRY(ReadString(object, "firstName", out.first_name));
  PW_TRY(ReadString(object, "lastName", out.last_name));
  PW_TRY(ReadString(object, "headline", out.headline));
  PW_TRY(ReadOptionalString(object, "bio", out.bio));
  PW_TRY(ReadOptionalString(object, "avatarURL", out.avatar_url));

  pw::InlineString<16> tier_name;
  PW_TRY(ReadString(object, "membershipTier", tier_name));
  auto tier = std::find_if(kTiers.begin(), kTiers.end(), [&](const auto& t) {
    return t.first == std::string_view(tier_name);
  });
  if (tier == kTiers.end()) {
    PW_LOG_WARN("Unknown membership tier %s", tier_name.c_str());
    return pw::Status::DataLoss();
  }
  out.tier = tier->second;

  PW_TRY(ReadSocials(object, "publicSocials", out.public_socials));

  if (level == ProfileLevel::kPublic) {
    if (Find(object, "phoneNumber") != nullptr ||
        Find(object, "email") != nullptr) {
      PW_LOG_WARN("Backend sent private fields at level=public; dropped");
    }
    return pw::OkStatus();
  }

  PW_TRY(ReadOptionalString(object, "phoneNumber", out.phone));
  PW_TRY(ReadOptionalString(object, "email", out.email));
  return ReadSocials(object, "privateSocials", out.private_socials);
}

}  // namespace

pw::Status FormatProfilePath(const ProfileRequest& request,
                             pw::StringBuilder& out) {
  if (request.member_id.empty()) {
    return pw::Status::InvalidArgument();
  }
  out << "/profiles/" << request.member_id.value();
  if (request.level == ProfileLevel::kPublic) {
    out << "?level=public";
  } else {
    if (!request.session_id.has_value() || request.session_id->empty()) {
      return pw::Status::InvalidArgument();
    }
    out << "?level=full&session=" << request.session_id->value();
  }
  return out.status();
}

pw::Result<Profile> DecodeProfile(pw::ConstByteSpan body, ProfileLevel level) {
  std::string_view text(reinterpret_cast<const char*>(body.data()),
                        body.size());
  json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    PW_LOG_WARN("Profile body is not a JSON object");
    return pw::Status::DataLoss();
  }

  Profile profile;
  pw::Status status = ReadProfile(parsed, level, profile);
  if (!status.ok()) {
    return pw::Status::DataLoss();
  }
  return profile;
}

}  // namespace steel::profile
