// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "TAGP"

#include "steel_core/modules/tag_payload/tag_payload.h"

#include <string>

#include "nlohmann/json.hpp"
#include "pw_log/log.h"
#include "pw_status/try.h"
#include "steel_core/modules/ndef/ndef_codec.h"
#include "steel_core/modules/tag_payload/steel_protocol.h"
#include "steel_core/modules/time/iso8601.h"

namespace steel::tag_payload {
namespace {

using nlohmann::json;

pw::Result<MemberId> MemberIdFromExternal(const ndef::ExternalRecord& record) {
  if (std::string_view(record.type_name) != kExternalType) {
    return pw::Status::NotFound();
  }

  std::string_view text(reinterpret_cast<const char*>(record.payload.data()),
                        record.payload.size());
  json payload = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (payload.is_discarded() || !payload.is_object()) {
    PW_LOG_DEBUG("External record payload is not a JSON object");
    return pw::Status::DataLoss();
  }

  auto it = payload.find(kMemberIdKey);
  if (it == payload.end() || !it->is_string()) {
    PW_LOG_DEBUG("External record has no memberId string");
    return pw::Status::DataLoss();
  }
  return MemberId::FromString(it->get_ref<const std::string&>());
}

}  // namespace

pw::Result<MemberId> MemberIdFromUri(std::string_view uri) {
  std::string_view path = uri;
  size_t scheme_end = uri.find("://");
  if (scheme_end != std::string_view::npos) {
    path = uri.substr(scheme_end + 3);
    size_t path_start = path.find('/');
    if (path_start == std::string_view::npos) {
      return pw::Status::NotFound();
    }
    path = path.substr(path_start);
  }
  path = path.substr(0, path.find_first_of("?#"));

  bool after_connect = false;
  while (!path.empty()) {
    if (path.front() == '/') {
      path.remove_prefix(1);
      continue;
    }
    size_t end = path.find('/');
    std::string_view segment = path.substr(0, end);
    if (after_connect) {
      return MemberId::FromString(segment);
    }
    after_connect = segment == kConnectSegment;
    path.remove_prefix(segment.size());
  }
  return pw::Status::NotFound();
}

pw::Result<TagIdentity> ExtractIdentity(const ndef::TagMessage& message) {
  TagIdentity identity;

  for (const ndef::TagRecord& record : message) {
    const auto* text = std::get_if<ndef::TextRecord>(&record);
    if (text != nullptr && !text->text.empty()) {
      identity.display_name = DisplayName(std::string_view(text->text));
      break;
    }
  }

  for (const ndef::TagRecord& record : message) {
    const auto* external = std::get_if<ndef::ExternalRecord>(&record);
    if (external == nullptr) {
      continue;
    }
    auto member_id = MemberIdFromExternal(*external);
    if (member_id.ok()) {
      identity.member_id = *member_id;
      return identity;
    }
  }

  for (const ndef::TagRecord& record : message) {
    const auto* uri = std::get_if<ndef::UriRecord>(&record);
    if (uri == nullptr) {
      continue;
    }
    auto member_id = MemberIdFromUri(std::string_view(uri->uri));
    if (member_id.ok()) {
      PW_LOG_INFO("Member id taken from fallback URI");
      identity.member_id = *member_id;
      return identity;
    }
  }

  return pw::Status::NotFound();
}

pw::Result<TagIdentity> DecodeTagPayload(pw::ConstByteSpan bytes) {
  PW_TRY_ASSIGN(ndef::TagMessage message, ndef::DecodeMessage(bytes));
  return ExtractIdentity(message);
}

pw::Result<ndef::TagMessage> BuildTagMessage(const MemberId& member_id,
                                             std::string_view display_name,
                                             std::time_t now_utc) {
  if (member_id.empty()) {
    return pw::Status::InvalidArgument();
  }
  if (display_name.size() > ndef::kMaxTextSize ||
      kFallbackUrlPrefix.size() + member_id.value().size() >
          ndef::kMaxUriSize) {
    return pw::Status::ResourceExhausted();
  }

  ndef::UriRecord uri;
  uri.uri.append(kFallbackUrlPrefix);
  uri.uri.append(member_id.value());

  ndef::TextRecord text;
  text.language = kDefaultLanguage;
  text.text = display_name;

  time::Iso8601String timestamp = time::FormatIso8601(now_utc);
  json payload = {
      {kMemberIdKey, std::string(member_id.value())},
      {kTimestampKey, std::string(std::string_view(timestamp))},
      {kVersionKey, std::string(kPayloadVersion)},
  };
  std::string payload_text = payload.dump();
  if (payload_text.size() > ndef::kMaxExternalPayloadSize) {
    return pw::Status::ResourceExhausted();
  }

  ndef::ExternalRecord external;
  external.type_name = kExternalType;
  for (char c : payload_text) {
    external.payload.push_back(static_cast<std::byte>(c));
  }

  ndef::TagMessage message;
  message.push_back(std::move(uri));
  message.push_back(std::move(text));
  message.push_back(std::move(external));
  return message;
}

pw::Result<size_t> EncodeTagPayload(const MemberId& member_id,
                                    std::string_view display_name,
                                    std::time_t now_utc,
                                    pw::ByteSpan out) {
  PW_TRY_ASSIGN(ndef::TagMessage message,
                BuildTagMessage(member_id, display_name, now_utc));
  return ndef::EncodeMessage(message, out);
}

}  // namespace steel::tag_payload
