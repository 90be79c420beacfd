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

#include "sharing/outbound_registry.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "internal/test/fake_clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

EndpointInfo CreateEndpoint(std::string id, std::optional<bool> present = {}) {
  EndpointInfo info;
  info.id = std::move(id);
  info.name = "Phone";
  info.address = "10.0.0.2";
  info.port = 5000;
  info.present = present;
  return info;
}

ProtocolEvent CreateEvent(std::string id, ProtocolState state) {
  ProtocolEvent event;
  event.id = std::move(id);
  event.direction = Direction::kOutbound;
  event.state = state;
  return event;
}

std::vector<std::string> Ids(const std::vector<OutboundSession>& sessions) {
  std::vector<std::string> ids;
  for (const OutboundSession& session : sessions) {
    ids.push_back(session.id());
  }
  return ids;
}

class OutboundRegistryTest : public ::testing::Test {
 protected:
  // Moves session `id` into `state` through engine events.
  void DriveTo(const std::string& id, OutboundTransferState state) {
    switch (state) {
      case OutboundTransferState::kAwaitingConsentOrIdle:
        break;
      case OutboundTransferState::kQueued:
        ASSERT_TRUE(registry_.PrepareSend(id, {"/tmp/f"}, 1).ok());
        ASSERT_EQ(registry_.Get(id)->state(), OutboundTransferState::kQueued);
        break;
      case OutboundTransferState::kRequestedForConsent:
        ASSERT_TRUE(registry_
                        .ApplyEvent(CreateEvent(
                            id, ProtocolState::kSentIntroduction))
                        .ok());
        break;
      case OutboundTransferState::kOngoingTransfer:
        ASSERT_TRUE(
            registry_.ApplyEvent(CreateEvent(id, ProtocolState::kSendingFiles))
                .ok());
        break;
      case OutboundTransferState::kFailed:
        ASSERT_TRUE(
            registry_.ApplyEvent(CreateEvent(id, ProtocolState::kDisconnected))
                .ok());
        break;
      case OutboundTransferState::kDone:
        ASSERT_TRUE(
            registry_.ApplyEvent(CreateEvent(id, ProtocolState::kFinished))
                .ok());
        break;
    }
    ASSERT_EQ(registry_.Get(id)->state(), state);
  }

  FakeClock clock_;
  OutboundRegistry registry_{&clock_};
};

TEST_F(OutboundRegistryTest, NewestEndpointIsListedFirst) {
  EXPECT_TRUE(registry_.Upsert(CreateEndpoint("dev1")));
  EXPECT_TRUE(registry_.Upsert(CreateEndpoint("dev2")));

  EXPECT_THAT(Ids(registry_.List()), ElementsAre("dev2", "dev1"));
}

TEST_F(OutboundRegistryTest, RediscoveryUpdatesExistingSession) {
  EXPECT_TRUE(registry_.Upsert(CreateEndpoint("dev1", true)));
  EXPECT_FALSE(registry_.Upsert(CreateEndpoint("dev1", false)));

  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(registry_.Get("dev1")->endpoint_info().present,
            std::optional<bool>(false));
}

TEST_F(OutboundRegistryTest, EventForUnknownIdIsNotFound) {
  absl::StatusOr<OutboundStateChange> change =
      registry_.ApplyEvent(CreateEvent("ghost", ProtocolState::kFinished));

  EXPECT_EQ(change.status().code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(OutboundRegistryTest, SendWhileAnotherRequestsConsentIsQueued) {
  registry_.Upsert(CreateEndpoint("a"));
  registry_.Upsert(CreateEndpoint("b"));
  registry_.Upsert(CreateEndpoint("c"));
  DriveTo("a", OutboundTransferState::kRequestedForConsent);

  absl::StatusOr<OutboundSession> session =
      registry_.PrepareSend("c", {"/tmp/x"}, 10);

  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->state(), OutboundTransferState::kQueued);
  EXPECT_EQ(registry_.Get("b")->state(),
            OutboundTransferState::kAwaitingConsentOrIdle);
}

TEST_F(OutboundRegistryTest, SendWithoutActiveTransferIsNotQueued) {
  registry_.Upsert(CreateEndpoint("a"));

  absl::StatusOr<OutboundSession> session =
      registry_.PrepareSend("a", {"/tmp/x", "/tmp/y"}, 10);

  ASSERT_TRUE(session.ok());
  EXPECT_EQ(session->state(), OutboundTransferState::kAwaitingConsentOrIdle);
  EXPECT_THAT(session->files(), ElementsAre("/tmp/x", "/tmp/y"));
  EXPECT_EQ(session->eta().total_len(), 10);
}

TEST_F(OutboundRegistryTest, SendToBusySessionFails) {
  registry_.Upsert(CreateEndpoint("a"));
  DriveTo("a", OutboundTransferState::kOngoingTransfer);

  EXPECT_EQ(registry_.PrepareSend("a", {"/tmp/x"}, 1).status().code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(registry_.PrepareSend("zzz", {"/tmp/x"}, 1).status().code(),
            absl::StatusCode::kNotFound);
}

TEST_F(OutboundRegistryTest, HasActiveTransfer) {
  registry_.Upsert(CreateEndpoint("a"));
  EXPECT_FALSE(registry_.HasActiveTransfer());

  DriveTo("a", OutboundTransferState::kOngoingTransfer);
  EXPECT_TRUE(registry_.HasActiveTransfer());

  DriveTo("a", OutboundTransferState::kDone);
  EXPECT_FALSE(registry_.HasActiveTransfer());
}

TEST_F(OutboundRegistryTest, RemoveIdleKeepsBusySessions) {
  const std::vector<std::pair<std::string, OutboundTransferState>> sessions = {
      {"idle", OutboundTransferState::kAwaitingConsentOrIdle},
      {"failed", OutboundTransferState::kFailed},
      {"done", OutboundTransferState::kDone},
      {"consent", OutboundTransferState::kRequestedForConsent},
      {"queued", OutboundTransferState::kQueued},
  };
  for (const auto& [id, state] : sessions) {
    registry_.Upsert(CreateEndpoint(id));
    DriveTo(id, state);
  }
  registry_.Upsert(CreateEndpoint("fresh"));

  std::vector<std::string> removed = registry_.RemoveIdle();

  EXPECT_THAT(removed,
              UnorderedElementsAre("idle", "failed", "done", "fresh"));
  EXPECT_THAT(Ids(registry_.List()), ElementsAre("queued", "consent"));
  EXPECT_FALSE(registry_.Get("idle").has_value());
}

TEST_F(OutboundRegistryTest, RemoveIdlePreservesOngoingTransfer) {
  registry_.Upsert(CreateEndpoint("a"));
  registry_.Upsert(CreateEndpoint("b"));
  DriveTo("a", OutboundTransferState::kOngoingTransfer);

  registry_.RemoveIdle();

  EXPECT_THAT(Ids(registry_.List()), ElementsAre("a"));
}

TEST_F(OutboundRegistryTest, RemoveIdleOnEmptyRegistry) {
  EXPECT_TRUE(registry_.RemoveIdle().empty());
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(OutboundRegistryTest, MarkFailed) {
  registry_.Upsert(CreateEndpoint("a"));

  absl::StatusOr<OutboundStateChange> change = registry_.MarkFailed("a");

  ASSERT_TRUE(change.ok());
  EXPECT_EQ(change->new_state, OutboundTransferState::kFailed);
  EXPECT_EQ(registry_.MarkFailed("b").status().code(),
            absl::StatusCode::kNotFound);
}

TEST_F(OutboundRegistryTest, MarkUnfinishedFailed) {
  registry_.Upsert(CreateEndpoint("idle"));
  registry_.Upsert(CreateEndpoint("done"));
  registry_.Upsert(CreateEndpoint("sending"));
  registry_.Upsert(CreateEndpoint("queued"));
  DriveTo("done", OutboundTransferState::kDone);
  DriveTo("sending", OutboundTransferState::kOngoingTransfer);
  DriveTo("queued", OutboundTransferState::kQueued);

  std::vector<std::string> failed = registry_.MarkUnfinishedFailed();

  EXPECT_THAT(failed, ElementsAre("queued", "sending"));
  EXPECT_EQ(registry_.Get("sending")->state(), OutboundTransferState::kFailed);
  EXPECT_EQ(registry_.Get("idle")->state(),
            OutboundTransferState::kAwaitingConsentOrIdle);
  EXPECT_EQ(registry_.Get("done")->state(), OutboundTransferState::kDone);
  EXPECT_FALSE(registry_.HasActiveTransfer());
}

}  // namespace
}  // namespace sharing
}  // namespace packet
