// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "sharing/inbound_slot.h"

#include <optional>
#include <string>
#include <utility>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "internal/test/fake_clock.h"
#include "sharing/inbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

ProtocolEvent CreateEvent(std::string id, ProtocolState state) {
  ProtocolEvent event;
  event.id = std::move(id);
  event.direction = Direction::kInbound;
  event.state = state;
  return event;
}

class InboundSlotTest : public ::testing::Test {
 protected:
  InboundSession CreateSession(std::string id) {
    return InboundSession(
        &clock_,
        CreateEvent(std::move(id), ProtocolState::kWaitingForUserConsent),
        "notification");
  }

  FakeClock clock_;
  InboundSlot slot_;
};

TEST_F(InboundSlotTest, OpenWhileOccupiedIsRefused) {
  EXPECT_TRUE(slot_.Open(CreateSession("t1")).ok());

  EXPECT_EQ(slot_.Open(CreateSession("t2")).code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(slot_.Get()->transfer_id(), "t1");
}

TEST_F(InboundSlotTest, TerminalEventWithMatchingIdReleasesSlot) {
  ASSERT_TRUE(slot_.Open(CreateSession("t1")).ok());

  absl::StatusOr<InboundSession> session =
      slot_.ApplyEvent(CreateEvent("t1", ProtocolState::kCancelled));

  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->last_event().state, ProtocolState::kCancelled);
  EXPECT_FALSE(slot_.IsOccupied());
}

TEST_F(InboundSlotTest, LateEventForOtherTransferIsIgnored) {
  ASSERT_TRUE(slot_.Open(CreateSession("t2")).ok());

  absl::StatusOr<InboundSession> session =
      slot_.ApplyEvent(CreateEvent("t1", ProtocolState::kDisconnected));

  EXPECT_EQ(session.status().code(), absl::StatusCode::kNotFound);
  ASSERT_TRUE(slot_.IsOccupied());
  EXPECT_EQ(slot_.Get()->last_event().state,
            ProtocolState::kWaitingForUserConsent);
}

TEST_F(InboundSlotTest, NonTerminalEventKeepsSlot) {
  ASSERT_TRUE(slot_.Open(CreateSession("t1")).ok());

  EXPECT_TRUE(
      slot_.ApplyEvent(CreateEvent("t1", ProtocolState::kReceivingFiles)).ok());
  EXPECT_TRUE(slot_.IsOccupied());
}

TEST_F(InboundSlotTest, SetUserActionOnEmptySlot) {
  EXPECT_EQ(
      slot_.SetUserAction("t1", UserAction::kConsentAccept).status().code(),
      absl::StatusCode::kNotFound);
}

TEST_F(InboundSlotTest, DeclineIfUnansweredOnlyOnce) {
  ASSERT_TRUE(slot_.Open(CreateSession("t1")).ok());

  absl::StatusOr<InboundSession> declined = slot_.DeclineIfUnanswered("t1");
  ASSERT_TRUE(declined.ok());
  EXPECT_EQ(declined->user_action(),
            std::optional<UserAction>(UserAction::kConsentDecline));

  EXPECT_EQ(slot_.DeclineIfUnanswered("t1").status().code(),
            absl::StatusCode::kFailedPrecondition);
}

TEST_F(InboundSlotTest, DeclineIfUnansweredAfterAccept) {
  ASSERT_TRUE(slot_.Open(CreateSession("t1")).ok());
  ASSERT_TRUE(slot_.SetUserAction("t1", UserAction::kConsentAccept).ok());

  EXPECT_EQ(slot_.DeclineIfUnanswered("t1").status().code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(slot_.Get()->user_action(),
            std::optional<UserAction>(UserAction::kConsentAccept));
}

TEST_F(InboundSlotTest, ReleaseEmptiesSlot) {
  ASSERT_TRUE(slot_.Open(CreateSession("t1")).ok());

  std::optional<InboundSession> released = slot_.Release();

  ASSERT_TRUE(released.has_value());
  EXPECT_EQ(released->transfer_id(), "t1");
  EXPECT_FALSE(slot_.IsOccupied());
  EXPECT_FALSE(slot_.Release().has_value());
}

}  // namespace
}  // namespace sharing
}  // namespace packet
