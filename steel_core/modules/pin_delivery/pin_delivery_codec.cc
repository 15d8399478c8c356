// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "PDEL"

#include "steel_core/modules/pin_delivery/pin_delivery_codec.h"

#include <algorithm>
#include <string>

#include "nlohmann/json.hpp"
#include "pw_log/log.h"

namespace steel::pin_delivery {
namespace {

using nlohmann::json;

constexpr const char* kSharerIdKey = "sharerId";
constexpr const char* kSessionIdKey = "sessionId";
constexpr const char* kPinKey = "pin";
constexpr const char* kExpiresAtKey = "expiresAt";
constexpr const char* kPinLengthKey = "pinLength";
constexpr const char* kSimulatedPinKey = "simulatedPIN";
constexpr const char* kVerifiedKey = "verified";
constexpr const char* kReasonKey = "reason";

pw::Result<size_t> WriteJson(const json& body, pw::ByteSpan out) {
  std::string text = body.dump();
  if (text.size() > out.size()) {
    return pw::Status::ResourceExhausted();
  }
  std::transform(text.begin(), text.end(), out.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  return text.size();
}

pw::Result<json> ParseObject(pw::ConstByteSpan body) {
  std::string_view text(reinterpret_cast<const char*>(body.data()),
                        body.size());
  json parsed = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    PW_LOG_WARN("Response body is not a JSON object");
    return pw::Status::DataLoss();
  }
  return parsed;
}

// Absent and null are treated alike.
const json* FindOptional(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

pw::Result<std::string_view> RequireString(const json& object,
                                           const char* key) {
  const json* value = FindOptional(object, key);
  if (value == nullptr || !value->is_string()) {
    PW_LOG_WARN("Response field '%s' missing or not a string", key);
    return pw::Status::DataLoss();
  }
  return std::string_view(value->get_ref<const std::string&>());
}

bool IsDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](char c) { return c >= '0' && c <= '9'; });
}

}  // namespace

pw::Result<size_t> EncodeSendPinRequest(const MemberId& sharer_id,
                                        pw::ByteSpan out) {
  if (sharer_id.empty()) {
    return pw::Status::InvalidArgument();
  }
  json body = {{kSharerIdKey, std::string(sharer_id.value())}};
  return WriteJson(body, out);
}

pw::Result<size_t> EncodeVerifyPinRequest(const SessionId& session_id,
                                          const PinCode& pin,
                                          pw::ByteSpan out) {
  if (session_id.empty() || pin.empty()) {
    return pw::Status::InvalidArgument();
  }
  json body = {
      {kSessionIdKey, std::string(session_id.value())},
      {kPinKey, std::string(std::string_view(pin))},
  };
  return WriteJson(body, out);
}

pw::Result<VerificationSession> DecodeSendPinResponse(
    pw::ConstByteSpan body, const time::ClockReference& reference) {
  auto parsed = ParseObject(body);
  if (!parsed.ok()) {
    return parsed.status();
  }
  const json& object = *parsed;

  auto session_text = RequireString(object, kSessionIdKey);
  auto sharer_text = RequireString(object, kSharerIdKey);
  auto expires_text = RequireString(object, kExpiresAtKey);
  if (!session_text.ok() || !sharer_text.ok() || !expires_text.ok()) {
    return pw::Status::DataLoss();
  }

  auto session_id = SessionId::FromString(*session_text);
  auto sharer_id = MemberId::FromString(*sharer_text);
  auto expires_utc = time::ParseIso8601(*expires_text);
  if (!session_id.ok() || !sharer_id.ok() || !expires_utc.ok()) {
    PW_LOG_WARN("Send-pin response has invalid identifiers or expiry");
    return pw::Status::DataLoss();
  }

  VerificationSession session;
  session.session_id = *session_id;
  session.sharer_id = *sharer_id;
  session.created_at = reference.local;
  session.expires_at = reference.ToLocal(*expires_utc);

  if (const json* length = FindOptional(object, kPinLengthKey)) {
    if (!length->is_number_integer()) {
      PW_LOG_WARN("pinLength is not an integer");
      return pw::Status::DataLoss();
    }
    int64_t value = length->get<int64_t>();
    if (value < 1 || value > static_cast<int64_t>(kMaxPinLength)) {
      PW_LOG_WARN("pinLength %d out of range", static_cast<int>(value));
      return pw::Status::DataLoss();
    }
    session.pin_length = static_cast<uint8_t>(value);
  }

  if (const json* pin = FindOptional(object, kSimulatedPinKey)) {
    if (!pin->is_string()) {
      return pw::Status::DataLoss();
    }
    std::string_view text = pin->get_ref<const std::string&>();
    if (text.size() != session.pin_length || !IsDigits(text)) {
      PW_LOG_WARN("simulatedPIN does not match pinLength");
      return pw::Status::DataLoss();
    }
    session.simulated_pin = PinCode(text);
  }

  return session;
}

pw::Result<bool> DecodeVerifyPinResponse(pw::ConstByteSpan body) {
  auto parsed = ParseObject(body);
  if (!parsed.ok()) {
    return parsed.status();
  }
  const json& object = *parsed;

  const json* verified = FindOptional(object, kVerifiedKey);
  if (verified == nullptr || !verified->is_boolean()) {
    PW_LOG_WARN("Verify-pin response has no boolean 'verified'");
    return pw::Status::DataLoss();
  }

  bool result = verified->get<bool>();
  if (const json* reason = FindOptional(object, kReasonKey);
      reason != nullptr && reason->is_string() && !result) {
    PW_LOG_INFO("PIN rejected by backend: %s",
                reason->get_ref<const std::string&>().c_str());
  }
  return result;
}

}  // namespace steel::pin_delivery
