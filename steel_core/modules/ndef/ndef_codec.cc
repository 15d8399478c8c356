// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#define PW_LOG_MODULE_NAME "NDEF"

#include "steel_core/modules/ndef/ndef_codec.h"

#include <array>
#include <string_view>

#include "pw_log/log.h"
#include "pw_status/try.h"

namespace steel::ndef {
namespace {

// NFC Forum URI RTD identifier codes. Index is the code byte.
constexpr std::array<std::string_view, 36> kUriPrefixes = {
    "",
    "http://www.",
    "https://www.",
    "http://",
    "https://",
    "tel:",
    "mailto:",
    "ftp://anonymous:anonymous@",
    "ftp://ftp.",
    "ftps://",
    "sftp://",
    "smb://",
    "nfs://",
    "ftp://",
    "dav://",
    "news:",
    "telnet://",
    "imap:",
    "rtsp://",
    "urn:",
    "pop:",
    "sip:",
    "sips:",
    "tftp:",
    "btspp://",
    "btl2cap://",
    "btgoep://",
    "tcpobex://",
    "irdaobex://",
    "file://",
    "urn:epc:id:",
    "urn:epc:tag:",
    "urn:epc:pat:",
    "urn:epc:raw:",
    "urn:epc:",
    "urn:nfc:",
};

constexpr char kUriType = 'U';
constexpr char kTextType = 'T';

std::string_view AsStringView(pw::ConstByteSpan bytes) {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                          bytes.size());
}

pw::ConstByteSpan AsBytes(std::string_view text) {
  return pw::ConstByteSpan(reinterpret_cast<const std::byte*>(text.data()),
                           text.size());
}

bool IsWellKnownType(pw::ConstByteSpan type, char expected) {
  return type.size() == 1 && static_cast<char>(type[0]) == expected;
}

// One record as framed on the wire, pointing into the message buffer.
struct RawRecord {
  uint8_t header = 0;
  pw::ConstByteSpan type;
  pw::ConstByteSpan payload;
};

// Splits off the record starting at `pos` and advances `pos` past it.
pw::Result<RawRecord> ReadRecord(pw::ConstByteSpan bytes, size_t& pos) {
  size_t offset = pos;
  if (bytes.size() - offset < 2) {
    return pw::Status::OutOfRange();
  }
  RawRecord record;
  record.header = static_cast<uint8_t>(bytes[offset]);
  size_t type_length = static_cast<uint8_t>(bytes[offset + 1]);
  offset += 2;

  size_t payload_length = 0;
  if (record.header & kFlagShortRecord) {
    if (bytes.size() - offset < 1) {
      return pw::Status::OutOfRange();
    }
    payload_length = static_cast<uint8_t>(bytes[offset]);
    offset += 1;
  } else {
    if (bytes.size() - offset < 4) {
      return pw::Status::OutOfRange();
    }
    for (size_t i = 0; i < 4; ++i) {
      payload_length =
          (payload_length << 8) | static_cast<uint8_t>(bytes[offset + i]);
    }
    offset += 4;
  }

  size_t id_length = 0;
  if (record.header & kFlagIdLength) {
    if (bytes.size() - offset < 1) {
      return pw::Status::OutOfRange();
    }
    id_length = static_cast<uint8_t>(bytes[offset]);
    offset += 1;
  }

  size_t remaining = bytes.size() - offset;
  if (type_length + id_length > remaining ||
      payload_length > remaining - type_length - id_length) {
    return pw::Status::OutOfRange();
  }

  record.type = bytes.subspan(offset, type_length);
  offset += type_length + id_length;
  record.payload = bytes.subspan(offset, payload_length);
  pos = offset + payload_length;
  return record;
}

pw::Result<TagRecord> DecodeRecord(const RawRecord& raw) {
  if (raw.header & kFlagChunk) {
    return pw::Status::Unimplemented();
  }

  auto tnf = static_cast<Tnf>(raw.header & kTnfMask);
  if (tnf == Tnf::kWellKnown && IsWellKnownType(raw.type, kUriType)) {
    PW_TRY_ASSIGN(UriRecord uri, DecodeUriPayload(raw.payload));
    return TagRecord(std::move(uri));
  }
  if (tnf == Tnf::kWellKnown && IsWellKnownType(raw.type, kTextType)) {
    PW_TRY_ASSIGN(TextRecord text, DecodeTextPayload(raw.payload));
    return TagRecord(std::move(text));
  }
  if (tnf == Tnf::kExternal) {
    if (raw.type.empty() || raw.type.size() > kMaxTypeNameSize ||
        raw.payload.size() > kMaxExternalPayloadSize) {
      return pw::Status::ResourceExhausted();
    }
    ExternalRecord external;
    external.type_name = AsStringView(raw.type);
    external.payload.assign(raw.payload.begin(), raw.payload.end());
    return TagRecord(std::move(external));
  }
  return pw::Status::Unimplemented();
}

// Bounded writer over the caller's output buffer.
class RecordWriter {
 public:
  explicit RecordWriter(pw::ByteSpan out) : out_(out) {}

  void Put(uint8_t value) {
    if (pos_ >= out_.size()) {
      overflow_ = true;
      return;
    }
    out_[pos_++] = static_cast<std::byte>(value);
  }

  void Put(pw::ConstByteSpan bytes) {
    if (bytes.size() > out_.size() - pos_) {
      overflow_ = true;
      return;
    }
    std::copy(bytes.begin(), bytes.end(), out_.begin() + pos_);
    pos_ += bytes.size();
  }

  void Put(std::string_view text) { Put(AsBytes(text)); }

  void PutHeader(uint8_t flags,
                 Tnf tnf,
                 size_t type_length,
                 size_t payload_length) {
    bool short_record = payload_length <= 0xFF;
    Put(static_cast<uint8_t>(flags | (short_record ? kFlagShortRecord : 0) |
                             static_cast<uint8_t>(tnf)));
    Put(static_cast<uint8_t>(type_length));
    if (short_record) {
      Put(static_cast<uint8_t>(payload_length));
    } else {
      Put(static_cast<uint8_t>(payload_length >> 24));
      Put(static_cast<uint8_t>(payload_length >> 16));
      Put(static_cast<uint8_t>(payload_length >> 8));
      Put(static_cast<uint8_t>(payload_length));
    }
  }

  bool overflow() const { return overflow_; }
  size_t size() const { return pos_; }

 private:
  pw::ByteSpan out_;
  size_t pos_ = 0;
  bool overflow_ = false;
};

// Longest prefix in the identifier code table that starts `uri`.
uint8_t FindUriPrefixCode(std::string_view uri) {
  uint8_t best = 0;
  for (size_t code = 1; code < kUriPrefixes.size(); ++code) {
    std::string_view prefix = kUriPrefixes[code];
    if (uri.substr(0, prefix.size()) == prefix &&
        prefix.size() > kUriPrefixes[best].size()) {
      best = static_cast<uint8_t>(code);
    }
  }
  return best;
}

void EncodeRecord(const TagRecord& record, uint8_t flags, RecordWriter& out) {
  if (const auto* uri = std::get_if<UriRecord>(&record)) {
    std::string_view value(uri->uri);
    uint8_t code = FindUriPrefixCode(value);
    std::string_view rest = value.substr(kUriPrefixes[code].size());
    out.PutHeader(flags, Tnf::kWellKnown, 1, 1 + rest.size());
    out.Put(static_cast<uint8_t>(kUriType));
    out.Put(code);
    out.Put(rest);
    return;
  }

  if (const auto* text = std::get_if<TextRecord>(&record)) {
    std::string_view language(text->language);
    std::string_view body(text->text);
    out.PutHeader(
        flags, Tnf::kWellKnown, 1, 1 + language.size() + body.size());
    out.Put(static_cast<uint8_t>(kTextType));
    out.Put(static_cast<uint8_t>(language.size() & kTextLanguageLengthMask));
    out.Put(language);
    out.Put(body);
    return;
  }

  const auto& external = std::get<ExternalRecord>(record);
  std::string_view type_name(external.type_name);
  out.PutHeader(
      flags, Tnf::kExternal, type_name.size(), external.payload.size());
  out.Put(type_name);
  out.Put(pw::ConstByteSpan(external.payload.data(), external.payload.size()));
}

}  // namespace

pw::Result<UriRecord> DecodeUriPayload(pw::ConstByteSpan payload) {
  if (payload.empty()) {
    return pw::Status::DataLoss();
  }
  auto code = static_cast<uint8_t>(payload[0]);
  if (code >= kUriPrefixes.size()) {
    return pw::Status::DataLoss();
  }
  std::string_view prefix = kUriPrefixes[code];
  std::string_view rest = AsStringView(payload.subspan(1));
  if (prefix.size() + rest.size() > kMaxUriSize) {
    return pw::Status::ResourceExhausted();
  }

  UriRecord record;
  record.uri.append(prefix);
  record.uri.append(rest);
  return record;
}

pw::Result<TextRecord> DecodeTextPayload(pw::ConstByteSpan payload) {
  if (payload.empty()) {
    return pw::Status::DataLoss();
  }
  auto status = static_cast<uint8_t>(payload[0]);
  if (status & kTextUtf16Flag) {
    return pw::Status::Unimplemented();
  }
  size_t language_length = status & kTextLanguageLengthMask;
  if (1 + language_length > payload.size()) {
    return pw::Status::DataLoss();
  }
  std::string_view text = AsStringView(payload.subspan(1 + language_length));
  if (text.size() > kMaxTextSize) {
    return pw::Status::ResourceExhausted();
  }

  TextRecord record;
  record.language = AsStringView(payload.subspan(1, language_length));
  record.text = text;
  return record;
}

pw::Result<TagMessage> DecodeMessage(pw::ConstByteSpan bytes) {
  TagMessage message;
  size_t pos = 0;

  while (pos < bytes.size()) {
    auto raw = ReadRecord(bytes, pos);
    if (!raw.ok()) {
      PW_LOG_DEBUG("Truncated record at offset %u",
                   static_cast<unsigned>(pos));
      break;
    }

    auto record = DecodeRecord(*raw);
    if (!record.ok()) {
      PW_LOG_DEBUG("Skipping record (header 0x%02x): %s",
                   raw->header,
                   record.status().str());
    } else if (message.full()) {
      PW_LOG_WARN("More than %u records, ignoring the rest",
                  static_cast<unsigned>(kMaxRecords));
    } else {
      message.push_back(std::move(*record));
    }

    if (raw->header & kFlagMessageEnd) {
      break;
    }
  }

  if (message.empty()) {
    return pw::Status::DataLoss();
  }
  return message;
}

pw::Result<size_t> EncodeMessage(const TagMessage& message, pw::ByteSpan out) {
  if (message.empty()) {
    return pw::Status::InvalidArgument();
  }

  RecordWriter writer(out);
  for (size_t i = 0; i < message.size(); ++i) {
    uint8_t flags = 0;
    if (i == 0) {
      flags |= kFlagMessageBegin;
    }
    if (i + 1 == message.size()) {
      flags |= kFlagMessageEnd;
    }
    EncodeRecord(message[i], flags, writer);
  }

  if (writer.overflow()) {
    return pw::Status::ResourceExhausted();
  }
  return writer.size();
}

}  // namespace steel::ndef
