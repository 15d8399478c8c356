// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/pin_delivery/pin_delivery_codec.h"

#include <array>
#include <chrono>
#include <string_view>

#include "pw_unit_test/framework.h"

namespace steel::pin_delivery {
namespace {

using namespace std::chrono_literals;
using Clock = pw::chrono::SystemClock;

constexpr std::time_t kNow = 1792413045;  // 2026-10-19T12:30:45Z

time::ClockReference Reference() {
  return time::ClockReference{
      kNow, Clock::time_point(std::chrono::duration_cast<Clock::duration>(
                std::chrono::seconds(1000)))};
}

pw::ConstByteSpan Body(std::string_view json) {
  return pw::as_bytes(pw::span(json.data(), json.size()));
}

std::string_view Text(pw::ConstByteSpan bytes, size_t size) {
  return std::string_view(reinterpret_cast<const char*>(bytes.data()), size);
}

// --- Requests ---

TEST(PinDeliveryCodecTest, EncodesSendPinRequest) {
  std::array<std::byte, kMaxRequestSize> buffer{};
  auto size =
      EncodeSendPinRequest(*MemberId::FromString("steel_001"), buffer);
  ASSERT_TRUE(size.ok());
  EXPECT_EQ(Text(buffer, *size), R"({"sharerId":"steel_001"})");
}

TEST(PinDeliveryCodecTest, EncodesVerifyPinRequest) {
  std::array<std::byte, kMaxRequestSize> buffer{};
  auto size = EncodeVerifyPinRequest(*SessionId::FromString("abc-123"),
                                     PinCode("7293"), buffer);
  ASSERT_TRUE(size.ok());
  EXPECT_EQ(Text(buffer, *size), R"({"pin":"7293","sessionId":"abc-123"})");
}

TEST(PinDeliveryCodecTest, RequestBufferTooSmall) {
  std::array<std::byte, 8> buffer{};
  auto size =
      EncodeSendPinRequest(*MemberId::FromString("steel_001"), buffer);
  EXPECT_EQ(size.status(), pw::Status::ResourceExhausted());
}

TEST(PinDeliveryCodecTest, VerifyRequiresPin) {
  std::array<std::byte, kMaxRequestSize> buffer{};
  auto size = EncodeVerifyPinRequest(*SessionId::FromString("abc-123"),
                                     PinCode(), buffer);
  EXPECT_EQ(size.status(), pw::Status::InvalidArgument());
}

// --- Send-pin response ---

TEST(PinDeliveryCodecTest, DecodesSendPinResponse) {
  auto session = DecodeSendPinResponse(
      Body(R"({"sessionId":"abc-123","sharerId":"steel_001",)"
           R"("expiresAt":"2026-10-19T12:32:45.000Z","pinLength":6})"),
      Reference());
  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->session_id.value(), "abc-123");
  EXPECT_EQ(session->sharer_id.value(), "steel_001");
  EXPECT_EQ(session->pin_length, 6);
  EXPECT_FALSE(session->simulated_pin.has_value());
  EXPECT_EQ(session->created_at, Reference().local);
  EXPECT_EQ(session->expires_at - session->created_at,
            std::chrono::duration_cast<Clock::duration>(120s));
}

TEST(PinDeliveryCodecTest, PinLengthDefaultsToFour) {
  auto session = DecodeSendPinResponse(
      Body(R"({"sessionId":"s","sharerId":"steel_001",)"
           R"("expiresAt":"2026-10-19T12:32:45Z","simulatedPIN":"1234"})"),
      Reference());
  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->pin_length, kDefaultPinLength);
  ASSERT_TRUE(session->simulated_pin.has_value());
  EXPECT_EQ(std::string_view(*session->simulated_pin), "1234");
}

TEST(PinDeliveryCodecTest, RejectsPinLengthOutOfRange) {
  for (std::string_view body :
       {R"({"sessionId":"s","sharerId":"m","expiresAt":"2026-10-19T12:32:45Z","pinLength":0})",
        R"({"sessionId":"s","sharerId":"m","expiresAt":"2026-10-19T12:32:45Z","pinLength":9})",
        R"({"sessionId":"s","sharerId":"m","expiresAt":"2026-10-19T12:32:45Z","pinLength":"4"})"}) {
    EXPECT_EQ(DecodeSendPinResponse(Body(body), Reference()).status(),
              pw::Status::DataLoss());
  }
}

TEST(PinDeliveryCodecTest, RejectsSimulatedPinOfWrongShape) {
  auto session = DecodeSendPinResponse(
      Body(R"({"sessionId":"s","sharerId":"m",)"
           R"("expiresAt":"2026-10-19T12:32:45Z","simulatedPIN":"12a4"})"),
      Reference());
  EXPECT_EQ(session.status(), pw::Status::DataLoss());
}

TEST(PinDeliveryCodecTest, RejectsMissingFields) {
  EXPECT_EQ(DecodeSendPinResponse(
                Body(R"({"sharerId":"m","expiresAt":"2026-10-19T12:32:45Z"})"),
                Reference())
                .status(),
            pw::Status::DataLoss());
  EXPECT_EQ(DecodeSendPinResponse(
                Body(R"({"sessionId":"s","sharerId":"m","expiresAt":null})"),
                Reference())
                .status(),
            pw::Status::DataLoss());
  EXPECT_EQ(DecodeSendPinResponse(
                Body(R"({"sessionId":"s","sharerId":"m","expiresAt":"soon"})"),
                Reference())
                .status(),
            pw::Status::DataLoss());
}

TEST(PinDeliveryCodecTest, RejectsNonJson) {
  EXPECT_EQ(DecodeSendPinResponse(Body("<html>"), Reference()).status(),
            pw::Status::DataLoss());
  EXPECT_EQ(DecodeVerifyPinResponse(Body("[true]")).status(),
            pw::Status::DataLoss());
}

// --- Verify-pin response ---

TEST(PinDeliveryCodecTest, DecodesVerifyPinResponse) {
  auto accepted = DecodeVerifyPinResponse(Body(R"({"verified":true})"));
  ASSERT_TRUE(accepted.ok());
  EXPECT_TRUE(*accepted);

  auto rejected = DecodeVerifyPinResponse(
      Body(R"({"verified":false,"reason":"Incorrect PIN"})"));
  ASSERT_TRUE(rejected.ok());
  EXPECT_FALSE(*rejected);
}

TEST(PinDeliveryCodecTest, VerifiedMustBeBoolean) {
  EXPECT_EQ(DecodeVerifyPinResponse(Body(R"({"verified":"yes"})")).status(),
            pw::Status::DataLoss());
  EXPECT_EQ(DecodeVerifyPinResponse(Body(R"({"reason":"Session expired"})"))
                .status(),
            pw::Status::DataLoss());
}

}  // namespace
}  // namespace steel::pin_delivery
