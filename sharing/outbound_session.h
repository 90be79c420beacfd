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

#ifndef PACKET_SHARING_OUTBOUND_SESSION_H_
#define PACKET_SHARING_OUTBOUND_SESSION_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/platform/clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/eta_estimator.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

enum class OutboundTransferState {
  kAwaitingConsentOrIdle,
  kQueued,
  kRequestedForConsent,
  kOngoingTransfer,
  kFailed,
  kDone,
};

std::string OutboundTransferStateToString(OutboundTransferState state);

// True while the session holds the single transfer allowed by the protocol.
bool IsActiveOutboundState(OutboundTransferState state);

// True for sessions that a recipient refresh drops.
bool IsRemovableOutboundState(OutboundTransferState state);

struct OutboundStateChange {
  bool changed() const { return old_state != new_state; }

  OutboundTransferState old_state;
  OutboundTransferState new_state;
};

// A send attempt towards one discovered endpoint. Keyed by endpoint id.
class OutboundSession {
 public:
  OutboundSession(const Clock* clock, EndpointInfo endpoint_info);

  const std::string& id() const { return endpoint_info_.id; }
  const EndpointInfo& endpoint_info() const { return endpoint_info_; }
  const std::vector<std::string>& files() const { return files_; }
  OutboundTransferState state() const { return state_; }
  const std::optional<ProtocolEvent>& last_event() const { return last_event_; }
  const EtaEstimator& eta() const { return eta_; }

  // Pin code of the current attempt, once the handshake reported one.
  std::optional<std::string> pin_code() const;

  void UpdateEndpointInfo(EndpointInfo endpoint_info);

  // Stores the files for the next send. `total_size` is the sum of their
  // sizes and becomes the ETA's transfer length.
  void SetFiles(std::vector<std::string> files, int64_t total_size);

  // Runs the outbound state machine for an engine event with this id.
  OutboundStateChange ApplyEvent(const ProtocolEvent& event);

  OutboundStateChange MarkQueued();

  // The engine refused the send request.
  OutboundStateChange MarkFailed();

  std::string ToString() const;

 private:
  OutboundStateChange SetState(OutboundTransferState state);

  EndpointInfo endpoint_info_;
  std::vector<std::string> files_;
  OutboundTransferState state_ = OutboundTransferState::kAwaitingConsentOrIdle;
  std::optional<ProtocolEvent> last_event_;
  EtaEstimator eta_;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_OUTBOUND_SESSION_H_
