// Copyright Offene Werkstatt Wädenswil
// SPDX-License-Identifier: MIT

#include "steel_core/modules/tag_session/tag_session.h"

#include <array>
#include <optional>
#include <string>
#include <variant>

#include "pw_allocator/testing.h"
#include "pw_async2/basic_dispatcher.h"
#include "pw_async2/coro_or_else_task.h"
#include "pw_async2/simulated_time_provider.h"
#include "pw_unit_test/framework.h"
#include "steel_core/modules/tag_payload/tag_payload.h"
#include "steel_core/modules/tag_session/mock/mock_tag_reader_driver.h"

namespace steel::tag_session {
namespace {

using namespace std::chrono_literals;

constexpr size_t kAllocatorSize = 8192;
constexpr std::time_t kNow = 1792413045;  // 2026-10-19T12:30:45Z

class TagSessionTest : public ::testing::Test {
 protected:
  void LoadSteelTag(std::string_view member, std::string_view name) {
    std::array<std::byte, tag_payload::kMaxNdefMessageSize> buffer{};
    auto size = tag_payload::EncodeTagPayload(
        *MemberId::FromString(member), name, kNow, buffer);
    ASSERT_TRUE(size.ok());
    driver_.SetTagContents(pw::ConstByteSpan(buffer.data(), *size));
  }

  void StartRead() {
    result_.reset();
    task_.emplace(RunRead(coro_cx_), [](pw::Status) {});
    dispatcher_.Post(*task_);
  }

  void StartWrite(std::string_view member, std::string_view name) {
    result_.reset();
    task_.emplace(RunWrite(coro_cx_, *MemberId::FromString(member), name),
                  [](pw::Status) {});
    dispatcher_.Post(*task_);
  }

  // Returns the finished outcome, or nullopt if the session is still busy.
  std::optional<TagSessionOutcome> Outcome() {
    dispatcher_.RunUntilStalled();
    if (!result_.has_value() || !result_->ok()) {
      return std::nullopt;
    }
    return result_->value();
  }

  TagSessionError FailureOf(const std::optional<TagSessionOutcome>& outcome) {
    return std::get<TagSessionFailure>(*outcome).error;
  }

  pw::async2::BasicDispatcher dispatcher_;
  pw::async2::SimulatedTimeProvider<pw::chrono::SystemClock> time_;
  pw::allocator::test::AllocatorForTest<kAllocatorSize> test_allocator_;
  pw::async2::CoroContext coro_cx_{test_allocator_};
  MockTagReaderDriver driver_;
  TagSession session_{driver_, time_};

  std::optional<pw::Result<TagSessionOutcome>> result_;
  std::optional<pw::async2::CoroOrElseTask> task_;

 private:
  pw::async2::Coro<pw::Status> RunRead(pw::async2::CoroContext& cx) {
    result_ = co_await session_.Read(cx);
    co_return pw::OkStatus();
  }

  pw::async2::Coro<pw::Status> RunWrite(pw::async2::CoroContext& cx,
                                        MemberId member,
                                        std::string_view name) {
    result_ = co_await session_.Write(cx, member, name, kNow);
    co_return pw::OkStatus();
  }
};

// --- Reading ---

TEST_F(TagSessionTest, ReadsSteelIdentity) {
  LoadSteelTag("steel_042", "Dana Kim");

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  const auto* success = std::get_if<TagReadSuccess>(&*outcome);
  ASSERT_NE(success, nullptr);
  EXPECT_EQ(success->identity.member_id.value(), "steel_042");
  EXPECT_EQ(driver_.alert_message(), kReadSuccessAlert);
  EXPECT_EQ(driver_.invalidate_count(), 1u);
  EXPECT_EQ(session_.state(), TagSessionStateId::kFinished);
}

TEST_F(TagSessionTest, ReaderUnavailableFailsWithoutPolling) {
  driver_.set_available(false);

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kNotAvailable);
  EXPECT_EQ(driver_.connect_count(), 0u);
}

TEST_F(TagSessionTest, NotNdefTagShowsErrorAlert) {
  driver_.set_capability(NdefCapability::kNotSupported);

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kNotNdefCompatible);
  EXPECT_EQ(driver_.alert_message(), "Tag is not NDEF compatible");
  EXPECT_EQ(driver_.read_count(), 0u);
  EXPECT_EQ(driver_.invalidate_count(), 1u);
}

TEST_F(TagSessionTest, BlankTagIsEmpty) {
  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kEmptyTag);
}

TEST_F(TagSessionTest, ReadErrorFails) {
  LoadSteelTag("steel_042", "Dana Kim");
  driver_.SetNextReadError(pw::Status::DeadlineExceeded());

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kReadFailed);
}

TEST_F(TagSessionTest, ConnectErrorFails) {
  driver_.QueueConnectResult(pw::Status::Unavailable());

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kConnectionFailed);
}

// --- Multiple tags ---

TEST_F(TagSessionTest, MultipleTagsWaitsThenPollsAgain) {
  LoadSteelTag("steel_042", "Dana Kim");
  driver_.QueueConnectResult(size_t{2});

  StartRead();
  EXPECT_FALSE(Outcome().has_value());
  EXPECT_EQ(session_.state(), TagSessionStateId::kConnecting);
  EXPECT_EQ(driver_.alert_message(), kMultipleTagsAlert);
  EXPECT_EQ(driver_.restart_polling_count(), 0u);

  time_.AdvanceTime(499ms);
  EXPECT_FALSE(Outcome().has_value());
  EXPECT_EQ(driver_.restart_polling_count(), 0u);

  time_.AdvanceTime(1ms);
  auto outcome = Outcome();
  EXPECT_EQ(driver_.restart_polling_count(), 1u);
  EXPECT_EQ(driver_.connect_count(), 2u);
  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<TagReadSuccess>(*outcome));
}

TEST_F(TagSessionTest, MultipleTagsRetryLimit) {
  TagSessionConfig config;
  config.max_multi_tag_retries = 1;
  TagSession session(driver_, time_, config);
  driver_.QueueConnectResult(size_t{3});
  driver_.QueueConnectResult(size_t{2});

  auto run = [&](pw::async2::CoroContext& cx) -> pw::async2::Coro<pw::Status> {
    result_ = co_await session.Read(cx);
    co_return pw::OkStatus();
  };
  task_.emplace(run(coro_cx_), [](pw::Status) {});
  dispatcher_.Post(*task_);
  dispatcher_.RunUntilStalled();

  time_.AdvanceTime(500ms);
  auto outcome = Outcome();
  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kConnectionFailed);
  EXPECT_EQ(driver_.restart_polling_count(), 1u);
}

// --- Cancellation ---

TEST_F(TagSessionTest, UserCancelOnReaderIsNotAnError) {
  driver_.QueueConnectResult(pw::Status::Cancelled());

  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<TagSessionCancelled>(*outcome));
  EXPECT_EQ(driver_.alert_count(), 0u);
  EXPECT_EQ(driver_.invalidate_count(), 0u);
}

TEST_F(TagSessionTest, CancelWhileReading) {
  LoadSteelTag("steel_042", "Dana Kim");
  driver_.set_hold_operations(true);

  StartRead();
  EXPECT_FALSE(Outcome().has_value());
  driver_.ReleaseHeldOperation();  // Connect
  EXPECT_FALSE(Outcome().has_value());
  driver_.ReleaseHeldOperation();  // QueryCapability
  EXPECT_FALSE(Outcome().has_value());
  EXPECT_EQ(session_.state(), TagSessionStateId::kReadingData);
  EXPECT_TRUE(session_.active());

  session_.Cancel();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<TagSessionCancelled>(*outcome));
  EXPECT_FALSE(session_.active());
  EXPECT_EQ(driver_.alert_count(), 0u);
}

TEST_F(TagSessionTest, CancelWhenIdleDoesNothing) {
  session_.Cancel();
  EXPECT_EQ(session_.state(), TagSessionStateId::kIdle);
  EXPECT_EQ(driver_.invalidate_count(), 0u);
}

TEST_F(TagSessionTest, NewReadAfterFinishedSession) {
  driver_.set_capability(NdefCapability::kNotSupported);
  StartRead();
  ASSERT_TRUE(Outcome().has_value());

  driver_.set_capability(NdefCapability::kReadWrite);
  LoadSteelTag("steel_007", "Sam Lee");
  StartRead();
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  const auto* success = std::get_if<TagReadSuccess>(&*outcome);
  ASSERT_NE(success, nullptr);
  EXPECT_EQ(success->identity.member_id.value(), "steel_007");
}

// --- Writing ---

TEST_F(TagSessionTest, WriteStoresSteelPayload) {
  StartWrite("steel_042", "Dana Kim");
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_TRUE(std::holds_alternative<TagWriteSuccess>(*outcome));
  EXPECT_EQ(driver_.alert_message(), kWriteSuccessAlert);

  auto identity = tag_payload::DecodeTagPayload(driver_.tag_contents());
  ASSERT_TRUE(identity.ok());
  EXPECT_EQ(identity->member_id.value(), "steel_042");
}

TEST_F(TagSessionTest, WrittenTagReadsBack) {
  StartWrite("steel_042", "Dana Kim");
  ASSERT_TRUE(Outcome().has_value());

  StartRead();
  auto outcome = Outcome();
  ASSERT_TRUE(outcome.has_value());
  const auto* success = std::get_if<TagReadSuccess>(&*outcome);
  ASSERT_NE(success, nullptr);
  EXPECT_EQ(success->identity.member_id.value(), "steel_042");
  ASSERT_TRUE(success->identity.display_name.has_value());
  EXPECT_EQ(std::string_view(*success->identity.display_name), "Dana Kim");
}

TEST_F(TagSessionTest, OversizeDisplayNameIsRejected) {
  const std::string name(129, 'x');

  StartWrite("steel_042", name);
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kWriteFailed);
  EXPECT_EQ(driver_.connect_count(), 0u);
  EXPECT_EQ(driver_.write_count(), 0u);
  EXPECT_TRUE(driver_.tag_contents().empty());
}

TEST_F(TagSessionTest, LongestDisplayNameIsWrittenWhole) {
  const std::string name(128, 'x');

  StartWrite("steel_042", name);
  auto outcome = Outcome();
  ASSERT_TRUE(outcome.has_value());
  ASSERT_TRUE(std::holds_alternative<TagWriteSuccess>(*outcome));

  auto identity = tag_payload::DecodeTagPayload(driver_.tag_contents());
  ASSERT_TRUE(identity.ok());
  ASSERT_TRUE(identity->display_name.has_value());
  EXPECT_EQ(std::string_view(*identity->display_name), name);
}

TEST_F(TagSessionTest, WriteToReadOnlyTagFails) {
  driver_.set_capability(NdefCapability::kReadOnly);

  StartWrite("steel_042", "Dana Kim");
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kReadOnlyTag);
  EXPECT_EQ(driver_.write_count(), 0u);
}

TEST_F(TagSessionTest, WriteErrorFails) {
  driver_.set_write_status(pw::Status::DataLoss());

  StartWrite("steel_042", "Dana Kim");
  auto outcome = Outcome();

  ASSERT_TRUE(outcome.has_value());
  EXPECT_EQ(FailureOf(outcome), TagSessionError::kWriteFailed);
  EXPECT_EQ(driver_.alert_message(), "Failed to write to tag");
}

}  // namespace
}  // namespace steel::tag_session
