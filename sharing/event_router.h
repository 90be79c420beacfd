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

#ifndef PACKET_SHARING_EVENT_ROUTER_H_
#define PACKET_SHARING_EVENT_ROUTER_H_

#include <string>

#include "absl/functional/any_invocable.h"
#include "internal/platform/clock.h"
#include "sharing/inbound_session.h"
#include "sharing/inbound_slot.h"
#include "sharing/outbound_registry.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

// Applies engine messages to the transfer registries, one at a time and in
// the order they are given.
//
// Internal engine messages are dropped. A WaitingForUserConsent event opens
// the inbound slot whatever its direction tag says; every other event is
// routed by direction.
//
// This class is not thread-safe; Route() is called from a single forwarding
// loop.
class EventRouter {
 public:
  class Delegate {
   public:
    virtual ~Delegate() = default;

    // A consent request took the inbound slot.
    virtual void OnInboundSessionOpened(const InboundSession& session) = 0;

    // A consent request arrived while another transfer held the slot.
    virtual void OnInboundRequestRefused(const ProtocolEvent& event) = 0;

    // The inbound session after `event` was applied. `released` is true if
    // the event ended the transfer and emptied the slot.
    virtual void OnInboundSessionUpdated(const InboundSession& session,
                                         const ProtocolEvent& event,
                                         bool released) = 0;

    virtual void OnOutboundSessionUpdated(const OutboundSession& session,
                                          OutboundStateChange change) = 0;
  };

  EventRouter(const Clock* clock, OutboundRegistry* outbound_registry,
              InboundSlot* inbound_slot, Delegate* delegate);

  // Overrides how notification ids of new inbound sessions are made.
  void SetNotificationIdGeneratorForTesting(
      absl::AnyInvocable<std::string()> generator);

  void Route(const EngineMessage& message);

 private:
  void RouteConsentRequest(const ProtocolEvent& event);
  void RouteInbound(const ProtocolEvent& event);
  void RouteOutbound(const ProtocolEvent& event);

  const Clock* const clock_;
  OutboundRegistry& outbound_registry_;
  InboundSlot& inbound_slot_;
  Delegate& delegate_;
  absl::AnyInvocable<std::string()> notification_id_generator_;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_EVENT_ROUTER_H_
