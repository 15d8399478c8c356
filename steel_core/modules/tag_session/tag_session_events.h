// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#pragma once

#include "etl/message.h"
#include "pw_bytes/span.h"
#include "pw_status/status.h"
#include "steel_core/modules/tag_session/tag_session_types.h"

namespace steel::tag_session {

/// Message IDs for TagSession FSM events.
enum class TagSessionMessageId : etl::message_id_t {
  kStart = 0,
  kConnected,
  kMultipleTags,
  kConnectFailed,
  kCapabilityReported,
  kCapabilityQueryFailed,
  kDataRead,
  kReadFailed,
  kWriteComplete,
  kCancel,
};

/// Begin a session (from Idle).
struct MsgStart
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kStart)> {
  MsgStart(TagSessionMode mode, bool reader_available)
      : mode(mode), reader_available(reader_available) {}
  TagSessionMode mode;
  bool reader_available;
};

/// Exactly one tag is present and connected.
struct MsgConnected
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kConnected)> {};

/// More than one tag is in the field.
struct MsgMultipleTags
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kMultipleTags)> {
};

struct MsgConnectFailed
    : public etl::message<static_cast<etl::message_id_t>(
          TagSessionMessageId::kConnectFailed)> {};

struct MsgCapabilityReported
    : public etl::message<static_cast<etl::message_id_t>(
          TagSessionMessageId::kCapabilityReported)> {
  explicit MsgCapabilityReported(NdefCapability capability)
      : capability(capability) {}
  NdefCapability capability;
};

struct MsgCapabilityQueryFailed
    : public etl::message<static_cast<etl::message_id_t>(
          TagSessionMessageId::kCapabilityQueryFailed)> {};

/// NDEF bytes retrieved from the tag. Only valid during receive().
struct MsgDataRead
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kDataRead)> {
  explicit MsgDataRead(pw::ConstByteSpan data) : data(data) {}
  pw::ConstByteSpan data;
};

struct MsgReadFailed
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kReadFailed)> {};

struct MsgWriteComplete
    : public etl::message<static_cast<etl::message_id_t>(
          TagSessionMessageId::kWriteComplete)> {
  explicit MsgWriteComplete(pw::Status status) : status(status) {}
  pw::Status status;
};

/// Caller invalidation or user cancel on the reader hardware.
struct MsgCancel
    : public etl::message<
          static_cast<etl::message_id_t>(TagSessionMessageId::kCancel)> {};

}  // namespace steel::tag_session
