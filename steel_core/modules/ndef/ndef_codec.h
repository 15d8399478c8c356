// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>

#include "pw_bytes/span.h"
#include "pw_result/result.h"
#include "steel_core/modules/ndef/ndef_record.h"

namespace steel::ndef {

// Record header flags (NFC Forum NDEF 1.0, section 3.2).
inline constexpr uint8_t kFlagMessageBegin = 0x80;
inline constexpr uint8_t kFlagMessageEnd = 0x40;
inline constexpr uint8_t kFlagChunk = 0x20;
inline constexpr uint8_t kFlagShortRecord = 0x10;
inline constexpr uint8_t kFlagIdLength = 0x08;
inline constexpr uint8_t kTnfMask = 0x07;

// Text record status byte.
inline constexpr uint8_t kTextUtf16Flag = 0x80;
inline constexpr uint8_t kTextLanguageLengthMask = 0x3F;

/// Decodes a raw NDEF message.
///
/// Decoding is lenient: records with an unknown TNF or type, chunked
/// records and malformed URI or text payloads are skipped. A truncated
/// tail ends decoding but keeps the records decoded before it.
///
/// @returns DataLoss if not a single record could be decoded.
pw::Result<TagMessage> DecodeMessage(pw::ConstByteSpan bytes);

/// Encodes `message` into `out` with MB/ME set on the first/last record
/// and short-record framing where the payload fits.
///
/// @returns Number of bytes written, InvalidArgument for an empty message,
///          or ResourceExhausted if `out` is too small.
pw::Result<size_t> EncodeMessage(const TagMessage& message, pw::ByteSpan out);

/// Decodes the payload of a well-known "U" record, expanding the
/// identifier code. Unknown codes return DataLoss.
pw::Result<UriRecord> DecodeUriPayload(pw::ConstByteSpan payload);

/// Decodes the payload of a well-known "T" record. UTF-16 text returns
/// Unimplemented.
pw::Result<TextRecord> DecodeTextPayload(pw::ConstByteSpan payload);

}  // namespace steel::ndef
