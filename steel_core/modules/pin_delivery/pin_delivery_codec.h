// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

/// @file pin_delivery_codec.h
/// @brief JSON bodies of the PIN delivery backend.
///
///   POST /sms/send-pin    {"sharerId"}        -> {"sessionId", "sharerId",
///                                                "expiresAt", "pinLength"}
///   POST /sms/verify-pin  {"sessionId","pin"} -> {"verified", "reason"?}
///
/// Encoders write compact JSON without a terminator and return its size.
/// Decoders return DataLoss for missing or ill-typed fields.

#include <cstddef>
#include <string_view>

#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "steel_core/modules/pin_delivery/pin_delivery_client.h"
#include "steel_core/modules/time/iso8601.h"
#include "steel_core/types.h"

namespace steel::pin_delivery {

inline constexpr std::string_view kSendPinPath = "/sms/send-pin";
inline constexpr std::string_view kVerifyPinPath = "/sms/verify-pin";

/// Large enough for any request body produced below.
inline constexpr size_t kMaxRequestSize = 160;

pw::Result<size_t> EncodeSendPinRequest(const MemberId& sharer_id,
                                        pw::ByteSpan out);

pw::Result<size_t> EncodeVerifyPinRequest(const SessionId& session_id,
                                          const PinCode& pin,
                                          pw::ByteSpan out);

/// Decodes a send-pin response received at `reference`.
///
/// "expiresAt" is converted to the local clock through `reference`;
/// `created_at` is the local receive time. "pinLength" defaults to
/// kDefaultPinLength and must be 1..kMaxPinLength. "simulatedPIN" is only
/// sent by development backends.
pw::Result<VerificationSession> DecodeSendPinResponse(
    pw::ConstByteSpan body, const time::ClockReference& reference);

/// @return The "verified" flag. "reason" is only logged.
pw::Result<bool> DecodeVerifyPinResponse(pw::ConstByteSpan body);

}  // namespace steel::pin_delivery
