// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/tag_payload/tag_payload.h"

#include <array>
#include <string_view>

#include "pw_unit_test/framework.h"
#include "steel_core/modules/ndef/ndef_codec.h"
#include "steel_core/modules/tag_payload/steel_protocol.h"

namespace steel::tag_payload {
namespace {

constexpr std::time_t kNow = 1792413045;  // 2026-10-19T12:30:45Z

ndef::ExternalRecord MakeExternal(std::string_view type_name,
                                  std::string_view json) {
  ndef::ExternalRecord record;
  record.type_name = type_name;
  for (char c : json) {
    record.payload.push_back(static_cast<std::byte>(c));
  }
  return record;
}

MemberId Member(std::string_view id) { return *MemberId::FromString(id); }

std::string_view PayloadText(const ndef::ExternalRecord& record) {
  return std::string_view(reinterpret_cast<const char*>(record.payload.data()),
                          record.payload.size());
}

// --- Building ---

TEST(TagPayloadTest, BuildsThreeRecordsInWireOrder) {
  auto message = BuildTagMessage(Member("steel_042"), "Dana Kim", kNow);
  ASSERT_TRUE(message.ok());
  ASSERT_EQ(message->size(), 3u);

  const auto& uri = std::get<ndef::UriRecord>((*message)[0]);
  EXPECT_EQ(std::string_view(uri.uri),
            "https://steel.byexo.com/connect/steel_042");

  const auto& text = std::get<ndef::TextRecord>((*message)[1]);
  EXPECT_EQ(std::string_view(text.language), "en");
  EXPECT_EQ(std::string_view(text.text), "Dana Kim");

  const auto& external = std::get<ndef::ExternalRecord>((*message)[2]);
  EXPECT_EQ(std::string_view(external.type_name), kExternalType);
  EXPECT_EQ(PayloadText(external),
            R"({"memberId":"steel_042","timestamp":"2026-10-19T12:30:45Z",)"
            R"("version":"1.0"})");
}

TEST(TagPayloadTest, EncodingIsStableForSameInputs) {
  std::array<std::byte, kMaxNdefMessageSize> first{};
  std::array<std::byte, kMaxNdefMessageSize> second{};

  auto first_size = EncodeTagPayload(Member("steel_042"), "Dana", kNow, first);
  auto second_size =
      EncodeTagPayload(Member("steel_042"), "Dana", kNow, second);
  ASSERT_TRUE(first_size.ok());
  ASSERT_TRUE(second_size.ok());
  ASSERT_EQ(*first_size, *second_size);
  EXPECT_TRUE(
      std::equal(first.begin(), first.begin() + *first_size, second.begin()));
}

TEST(TagPayloadTest, RejectsOversizedDisplayName) {
  std::array<char, ndef::kMaxTextSize + 1> name;
  name.fill('x');
  auto message = BuildTagMessage(Member("steel_042"),
                                 std::string_view(name.data(), name.size()),
                                 kNow);
  EXPECT_EQ(message.status(), pw::Status::ResourceExhausted());
}

// --- Decoding ---

TEST(TagPayloadTest, EncodedPayloadDecodesToSameIdentity) {
  std::array<std::byte, kMaxNdefMessageSize> buffer{};
  auto size = EncodeTagPayload(Member("steel_042"), "Dana Kim", kNow, buffer);
  ASSERT_TRUE(size.ok());

  auto identity = DecodeTagPayload(pw::ConstByteSpan(buffer.data(), *size));
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "steel_042");
  ASSERT_TRUE(identity->display_name.has_value());
  EXPECT_EQ(std::string_view(*identity->display_name), "Dana Kim");
}

TEST(TagPayloadTest, UriOnlyMessageFallsBackToConnectSegment) {
  ndef::TagMessage message;
  message.push_back(ndef::UriRecord{.uri = "https://steel.byexo.com/connect/XYZ"});

  auto identity = ExtractIdentity(message);
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "XYZ");
  EXPECT_FALSE(identity->display_name.has_value());
}

TEST(TagPayloadTest, ExternalRecordWinsOverDifferingUri) {
  ndef::TagMessage message;
  message.push_back(ndef::UriRecord{.uri = "https://steel.byexo.com/connect/URI"});
  message.push_back(MakeExternal(kExternalType, R"({"memberId":"EXT"})"));

  auto identity = ExtractIdentity(message);
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "EXT");
}

TEST(TagPayloadTest, MalformedExternalFallsBackToUri) {
  ndef::TagMessage message;
  message.push_back(MakeExternal(kExternalType, R"({"memberId": )"));
  message.push_back(MakeExternal(kExternalType, R"({"memberId":""})"));
  message.push_back(MakeExternal(kExternalType, R"({"memberId":42})"));
  message.push_back(ndef::UriRecord{.uri = "https://steel.byexo.com/connect/URI"});

  auto identity = ExtractIdentity(message);
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "URI");
}

TEST(TagPayloadTest, ForeignExternalTypeIsIgnored) {
  ndef::TagMessage message;
  message.push_back(MakeExternal("com.other:app", R"({"memberId":"NOPE"})"));
  message.push_back(MakeExternal(kExternalType, R"({"memberId":"YES"})"));

  auto identity = ExtractIdentity(message);
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "YES");
}

TEST(TagPayloadTest, NoIdentifierIsNotFound) {
  ndef::TagMessage message;
  message.push_back(ndef::UriRecord{.uri = "https://example.com/profile/ABC"});
  message.push_back(ndef::TextRecord{.language = "en", .text = "Someone"});

  EXPECT_EQ(ExtractIdentity(message).status(), pw::Status::NotFound());
}

TEST(TagPayloadTest, FirstNonEmptyTextIsDisplayName) {
  ndef::TagMessage message;
  message.push_back(ndef::TextRecord{.language = "en", .text = ""});
  message.push_back(ndef::TextRecord{.language = "de", .text = "Jo"});
  message.push_back(MakeExternal(kExternalType, R"({"memberId":"M1"})"));

  auto identity = ExtractIdentity(message);
  ASSERT_TRUE(identity.ok());
  ASSERT_TRUE(identity->display_name.has_value());
  EXPECT_EQ(std::string_view(*identity->display_name), "Jo");
}

TEST(TagPayloadTest, UndecodableBytesAreDataLoss) {
  constexpr std::array<std::byte, 2> kGarbage = {std::byte{0xD1},
                                                 std::byte{0x01}};
  EXPECT_EQ(DecodeTagPayload(kGarbage).status(), pw::Status::DataLoss());
}

// --- Fallback URI parsing ---

TEST(TagPayloadTest, MemberIdFromUriIgnoresQueryAndFragment) {
  auto id = MemberIdFromUri("https://steel.byexo.com/connect/abc?ref=nfc#top");
  ASSERT_TRUE(id.ok());
  EXPECT_EQ(id->value(), "abc");
}

TEST(TagPayloadTest, MemberIdFromUriNeedsComponentAfterConnect) {
  EXPECT_FALSE(MemberIdFromUri("https://steel.byexo.com/connect").ok());
  EXPECT_FALSE(MemberIdFromUri("https://steel.byexo.com/connect/").ok());
  EXPECT_FALSE(MemberIdFromUri("https://connect/abc").ok());
}

TEST(TagPayloadTest, MemberIdFromUriAcceptsNestedPaths) {
  auto id = MemberIdFromUri("https://host/app/connect/m-7/extra");
  ASSERT_TRUE(id.ok());
  EXPECT_EQ(id->value(), "m-7");
}

}  // namespace
}  // namespace steel::tag_payload
