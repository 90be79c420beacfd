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

#include "sharing/event_router.h"

#include <optional>
#include <string>
#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "internal/test/fake_clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/inbound_session.h"
#include "sharing/inbound_slot.h"
#include "sharing/outbound_registry.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Property;
using ::testing::StrictMock;

class MockDelegate : public EventRouter::Delegate {
 public:
  MOCK_METHOD(void, OnInboundSessionOpened, (const InboundSession& session),
              (override));
  MOCK_METHOD(void, OnInboundRequestRefused, (const ProtocolEvent& event),
              (override));
  MOCK_METHOD(void, OnInboundSessionUpdated,
              (const InboundSession& session, const ProtocolEvent& event,
               bool released),
              (override));
  MOCK_METHOD(void, OnOutboundSessionUpdated,
              (const OutboundSession& session, OutboundStateChange change),
              (override));
};

ProtocolEvent CreateEvent(std::string id, Direction direction,
                          ProtocolState state) {
  ProtocolEvent event;
  event.id = std::move(id);
  event.direction = direction;
  event.state = state;
  return event;
}

auto StateChange(OutboundTransferState from, OutboundTransferState to) {
  return AllOf(Field(&OutboundStateChange::old_state, from),
               Field(&OutboundStateChange::new_state, to));
}

class EventRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    router_.SetNotificationIdGeneratorForTesting(
        []() { return std::string("notification-1"); });
  }

  void AddEndpoint(std::string id) {
    EndpointInfo endpoint_info;
    endpoint_info.id = std::move(id);
    endpoint_info.address = "192.168.1.20";
    endpoint_info.port = 9300;
    outbound_registry_.Upsert(endpoint_info);
  }

  std::string SlotString() const {
    std::optional<InboundSession> session = inbound_slot_.Get();
    return session ? session->ToString() : "empty";
  }

  FakeClock clock_;
  OutboundRegistry outbound_registry_{&clock_};
  InboundSlot inbound_slot_;
  StrictMock<MockDelegate> delegate_;
  EventRouter router_{&clock_, &outbound_registry_, &inbound_slot_,
                      &delegate_};
};

TEST_F(EventRouterTest, InternalMessagesChangeNothing) {
  AddEndpoint("idle");
  AddEndpoint("sending");
  AddEndpoint("failed");
  {
    // Build up a mixture of states first.
    testing::NiceMock<MockDelegate> setup_delegate;
    EventRouter setup_router(&clock_, &outbound_registry_, &inbound_slot_,
                             &setup_delegate);
    setup_router.Route(CreateEvent("sending", Direction::kOutbound,
                                   ProtocolState::kSendingFiles));
    setup_router.Route(CreateEvent("failed", Direction::kOutbound,
                                   ProtocolState::kDisconnected));
    setup_router.Route(CreateEvent("inbound", Direction::kInbound,
                                   ProtocolState::kWaitingForUserConsent));
  }
  std::string registry_before = outbound_registry_.DebugString();
  std::string slot_before = SlotString();

  for (int i = 0; i < 100; ++i) {
    InternalMessage message;
    switch (i % 4) {
      case 0:
        message.id = "sending";
        message.action = TransferAction::kTransferCancel;
        break;
      case 1:
        message.id = "inbound";
        message.action = TransferAction::kConsentAccept;
        break;
      case 2:
        message.id = "inbound";
        message.action = TransferAction::kConsentDecline;
        break;
      default:
        message.id = "unknown";
        break;
    }
    router_.Route(message);
  }

  EXPECT_EQ(outbound_registry_.DebugString(), registry_before);
  EXPECT_EQ(SlotString(), slot_before);
}

TEST_F(EventRouterTest, ConsentRequestOpensInboundSession) {
  EXPECT_CALL(delegate_,
              OnInboundSessionOpened(AllOf(
                  Property(&InboundSession::transfer_id, "t1"),
                  Property(&InboundSession::notification_id,
                           "notification-1"))));

  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));

  ASSERT_TRUE(inbound_slot_.IsOccupied());
  EXPECT_TRUE(inbound_slot_.Get()->IsAwaitingConsent());
}

TEST_F(EventRouterTest, ConsentRequestIgnoresDirectionTag) {
  AddEndpoint("t1");
  EXPECT_CALL(delegate_, OnInboundSessionOpened(_));

  router_.Route(CreateEvent("t1", Direction::kOutbound,
                            ProtocolState::kWaitingForUserConsent));

  EXPECT_TRUE(inbound_slot_.IsOccupied());
  EXPECT_EQ(outbound_registry_.Get("t1")->state(),
            OutboundTransferState::kAwaitingConsentOrIdle);
}

TEST_F(EventRouterTest, SecondConsentRequestIsRefused) {
  EXPECT_CALL(delegate_, OnInboundSessionOpened(_));
  EXPECT_CALL(delegate_,
              OnInboundRequestRefused(Field(&ProtocolEvent::id, "t2")));

  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));
  router_.Route(CreateEvent("t2", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));

  EXPECT_EQ(inbound_slot_.Get()->transfer_id(), "t1");
}

TEST_F(EventRouterTest, RepeatedConsentRequestUpdatesSession) {
  EXPECT_CALL(delegate_, OnInboundSessionOpened(_));
  EXPECT_CALL(delegate_, OnInboundSessionUpdated(
                             Property(&InboundSession::transfer_id, "t1"), _,
                             false));

  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));
  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));

  EXPECT_TRUE(inbound_slot_.Get()->IsAwaitingConsent());
}

TEST_F(EventRouterTest, InboundEventsFollowTheSlot) {
  InSequence sequence;
  EXPECT_CALL(delegate_, OnInboundSessionOpened(_));
  EXPECT_CALL(delegate_,
              OnInboundSessionUpdated(
                  _, Field(&ProtocolEvent::state, ProtocolState::kReceivingFiles),
                  false));
  EXPECT_CALL(delegate_,
              OnInboundSessionUpdated(
                  Property(&InboundSession::view, InboundView::kClosed),
                  Field(&ProtocolEvent::state, ProtocolState::kFinished),
                  true));

  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));
  router_.Route(CreateEvent("t1", Direction::kInbound,
                            ProtocolState::kReceivingFiles));
  router_.Route(
      CreateEvent("t1", Direction::kInbound, ProtocolState::kFinished));

  EXPECT_FALSE(inbound_slot_.IsOccupied());
}

TEST_F(EventRouterTest, InboundEventForOtherTransferIsDropped) {
  EXPECT_CALL(delegate_, OnInboundSessionOpened(_));

  router_.Route(CreateEvent("t2", Direction::kInbound,
                            ProtocolState::kWaitingForUserConsent));
  router_.Route(
      CreateEvent("t1", Direction::kInbound, ProtocolState::kDisconnected));

  ASSERT_TRUE(inbound_slot_.IsOccupied());
  EXPECT_EQ(inbound_slot_.Get()->last_event().state,
            ProtocolState::kWaitingForUserConsent);
}

TEST_F(EventRouterTest, InboundEventWithEmptySlotIsDropped) {
  router_.Route(
      CreateEvent("t1", Direction::kInbound, ProtocolState::kReceivingFiles));

  EXPECT_FALSE(inbound_slot_.IsOccupied());
}

TEST_F(EventRouterTest, OutboundEventForUnknownSessionIsDropped) {
  AddEndpoint("known");
  std::string before = outbound_registry_.DebugString();

  router_.Route(CreateEvent("refreshed-away", Direction::kOutbound,
                            ProtocolState::kSendingFiles));

  EXPECT_EQ(outbound_registry_.DebugString(), before);
}

TEST_F(EventRouterTest, OutboundEventsAppliedInOrder) {
  AddEndpoint("dev1");
  InSequence sequence;
  EXPECT_CALL(delegate_,
              OnOutboundSessionUpdated(
                  Property(&OutboundSession::id, "dev1"),
                  StateChange(OutboundTransferState::kAwaitingConsentOrIdle,
                              OutboundTransferState::kRequestedForConsent)));
  EXPECT_CALL(delegate_,
              OnOutboundSessionUpdated(
                  _, StateChange(OutboundTransferState::kRequestedForConsent,
                                 OutboundTransferState::kOngoingTransfer)));
  EXPECT_CALL(delegate_,
              OnOutboundSessionUpdated(
                  _, StateChange(OutboundTransferState::kOngoingTransfer,
                                 OutboundTransferState::kDone)));

  router_.Route(CreateEvent("dev1", Direction::kOutbound,
                            ProtocolState::kSentIntroduction));
  router_.Route(CreateEvent("dev1", Direction::kOutbound,
                            ProtocolState::kSendingFiles));
  router_.Route(
      CreateEvent("dev1", Direction::kOutbound, ProtocolState::kFinished));

  EXPECT_EQ(outbound_registry_.Get("dev1")->state(),
            OutboundTransferState::kDone);
}

}  // namespace
}  // namespace sharing
}  // namespace packet
