// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <ctime>
#include <optional>
#include <string_view>

#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "steel_core/modules/ndef/ndef_record.h"
#include "steel_core/types.h"

namespace steel::tag_payload {

/// Who a Steel tag belongs to.
struct TagIdentity {
  MemberId member_id = MemberId::Empty();
  std::optional<DisplayName> display_name;
};

/// Finds the member identity in a decoded tag message.
///
/// The first external record of type kExternalType whose JSON carries a
/// non-empty "memberId" wins. Failing that, the first URI record with a
/// ".../connect/{id}" path is used. Malformed candidates are skipped.
/// The first non-empty text record becomes the display name.
///
/// @returns NotFound if no record yields a member id.
pw::Result<TagIdentity> ExtractIdentity(const ndef::TagMessage& message);

/// Decodes raw NDEF bytes read from a tag and extracts the identity.
///
/// @returns DataLoss if no record decodes, NotFound if none identifies
///          a member.
pw::Result<TagIdentity> DecodeTagPayload(pw::ConstByteSpan bytes);

/// Member id from a fallback URI such as
/// "https://steel.byexo.com/connect/{id}".
pw::Result<MemberId> MemberIdFromUri(std::string_view uri);

/// Builds the three records written to a Steel tag, in wire order:
/// fallback URI, display name text, external JSON payload.
pw::Result<ndef::TagMessage> BuildTagMessage(const MemberId& member_id,
                                             std::string_view display_name,
                                             std::time_t now_utc);

/// BuildTagMessage followed by NDEF encoding into `out`.
pw::Result<size_t> EncodeTagPayload(const MemberId& member_id,
                                    std::string_view display_name,
                                    std::time_t now_utc,
                                    pw::ByteSpan out);

}  // namespace steel::tag_payload
