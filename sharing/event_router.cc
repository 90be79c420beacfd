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

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "absl/functional/any_invocable.h"
#include "absl/random/random.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_format.h"
#include "internal/platform/clock.h"
#include "sharing/inbound_session.h"
#include "sharing/inbound_slot.h"
#include "sharing/internal/public/logging.h"
#include "sharing/outbound_registry.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

std::string GenerateNotificationId() {
  absl::BitGen bitgen;
  return absl::StrFormat("packet-transfer-%016x",
                         absl::Uniform<uint64_t>(bitgen));
}

}  // namespace

EventRouter::EventRouter(const Clock* clock,
                         OutboundRegistry* outbound_registry,
                         InboundSlot* inbound_slot, Delegate* delegate)
    : clock_(clock),
      outbound_registry_(*outbound_registry),
      inbound_slot_(*inbound_slot),
      delegate_(*delegate),
      notification_id_generator_(GenerateNotificationId) {}

void EventRouter::SetNotificationIdGeneratorForTesting(
    absl::AnyInvocable<std::string()> generator) {
  notification_id_generator_ = std::move(generator);
}

void EventRouter::Route(const EngineMessage& message) {
  if (const auto* internal = std::get_if<InternalMessage>(&message)) {
    VLOG(1) << __func__ << ": Dropping internal message for " << internal->id;
    return;
  }
  const ProtocolEvent& event = std::get<ProtocolEvent>(message);
  VLOG(1) << __func__ << ": " << event.ToString();

  if (event.state == ProtocolState::kWaitingForUserConsent) {
    RouteConsentRequest(event);
    return;
  }
  switch (event.direction) {
    case Direction::kInbound:
      RouteInbound(event);
      break;
    case Direction::kOutbound:
      RouteOutbound(event);
      break;
  }
}

void EventRouter::RouteConsentRequest(const ProtocolEvent& event) {
  std::optional<InboundSession> current = inbound_slot_.Get();
  if (current.has_value() && current->transfer_id() == event.id) {
    // Repeated request for the transfer already awaiting an answer.
    RouteInbound(event);
    return;
  }

  InboundSession session(clock_, event, notification_id_generator_());
  absl::Status status = inbound_slot_.Open(session);
  if (!status.ok()) {
    LOG(WARNING) << __func__ << ": " << status;
    delegate_.OnInboundRequestRefused(event);
    return;
  }
  delegate_.OnInboundSessionOpened(session);
}

void EventRouter::RouteInbound(const ProtocolEvent& event) {
  absl::StatusOr<InboundSession> session = inbound_slot_.ApplyEvent(event);
  if (!session.ok()) {
    VLOG(1) << __func__ << ": Dropping event. " << session.status();
    return;
  }
  delegate_.OnInboundSessionUpdated(*session, event,
                                    IsTerminalState(event.state));
}

void EventRouter::RouteOutbound(const ProtocolEvent& event) {
  absl::StatusOr<OutboundStateChange> change =
      outbound_registry_.ApplyEvent(event);
  if (!change.ok()) {
    // The session may have been dropped by a refresh.
    VLOG(1) << __func__ << ": Dropping event. " << change.status();
    return;
  }
  std::optional<OutboundSession> session = outbound_registry_.Get(event.id);
  if (!session.has_value()) {
    return;
  }
  delegate_.OnOutboundSessionUpdated(*session, *change);
}

}  // namespace sharing
}  // namespace packet
