// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <variant>

#include "pw_containers/vector.h"
#include "pw_string/string.h"

namespace steel::ndef {

inline constexpr size_t kMaxUriSize = 192;
inline constexpr size_t kMaxLanguageSize = 63;  // 6-bit length field
inline constexpr size_t kMaxTextSize = 128;
inline constexpr size_t kMaxTypeNameSize = 64;
inline constexpr size_t kMaxExternalPayloadSize = 256;
inline constexpr size_t kMaxRecords = 8;

/// NDEF Type Name Format (low 3 bits of the record header).
enum class Tnf : uint8_t {
  kEmpty = 0x00,
  kWellKnown = 0x01,
  kMediaType = 0x02,
  kAbsoluteUri = 0x03,
  kExternal = 0x04,
  kUnknown = 0x05,
  kUnchanged = 0x06,
  kReserved = 0x07,
};

/// Well-known URI record (type "U").
struct UriRecord {
  pw::InlineString<kMaxUriSize> uri;

  bool operator==(const UriRecord& other) const = default;
};

/// Well-known text record (type "T"), always UTF-8.
struct TextRecord {
  pw::InlineString<kMaxLanguageSize> language;
  pw::InlineString<kMaxTextSize> text;

  bool operator==(const TextRecord& other) const = default;
};

/// NFC Forum external type record (TNF 0x04), e.g. "com.exo.steel:connect".
struct ExternalRecord {
  pw::InlineString<kMaxTypeNameSize> type_name;
  pw::Vector<std::byte, kMaxExternalPayloadSize> payload;

  bool operator==(const ExternalRecord& other) const {
    return type_name == other.type_name &&
           std::equal(payload.begin(), payload.end(), other.payload.begin(),
                      other.payload.end());
  }
};

using TagRecord = std::variant<UriRecord, TextRecord, ExternalRecord>;

/// Records in wire order.
using TagMessage = pw::Vector<TagRecord, kMaxRecords>;

}  // namespace steel::ndef
