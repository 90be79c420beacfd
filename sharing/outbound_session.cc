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

#include "sharing/outbound_session.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "internal/platform/clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/internal/public/logging.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

std::string OutboundTransferStateToString(OutboundTransferState state) {
  switch (state) {
    case OutboundTransferState::kAwaitingConsentOrIdle:
      return "kAwaitingConsentOrIdle";
    case OutboundTransferState::kQueued:
      return "kQueued";
    case OutboundTransferState::kRequestedForConsent:
      return "kRequestedForConsent";
    case OutboundTransferState::kOngoingTransfer:
      return "kOngoingTransfer";
    case OutboundTransferState::kFailed:
      return "kFailed";
    case OutboundTransferState::kDone:
      return "kDone";
  }
  return "kUnknown";
}

bool IsActiveOutboundState(OutboundTransferState state) {
  return state == OutboundTransferState::kRequestedForConsent ||
         state == OutboundTransferState::kOngoingTransfer;
}

bool IsRemovableOutboundState(OutboundTransferState state) {
  return state == OutboundTransferState::kAwaitingConsentOrIdle ||
         state == OutboundTransferState::kFailed ||
         state == OutboundTransferState::kDone;
}

OutboundSession::OutboundSession(const Clock* clock, EndpointInfo endpoint_info)
    : endpoint_info_(std::move(endpoint_info)), eta_(clock, 0) {}

std::optional<std::string> OutboundSession::pin_code() const {
  if (!last_event_ || !last_event_->metadata) {
    return std::nullopt;
  }
  return last_event_->metadata->pin_code;
}

void OutboundSession::UpdateEndpointInfo(EndpointInfo endpoint_info) {
  endpoint_info_ = std::move(endpoint_info);
}

void OutboundSession::SetFiles(std::vector<std::string> files,
                               int64_t total_size) {
  files_ = std::move(files);
  eta_.PrepareForNewTransfer(total_size);
}

OutboundStateChange OutboundSession::ApplyEvent(const ProtocolEvent& event) {
  last_event_ = event;
  switch (event.state) {
    case ProtocolState::kSentUkeyClientInit:
    case ProtocolState::kSentUkeyClientFinish:
    case ProtocolState::kSentIntroduction:
      // The length was set along with the files.
      eta_.PrepareForNewTransfer(std::nullopt);
      return SetState(OutboundTransferState::kRequestedForConsent);
    case ProtocolState::kSendingFiles:
      if (event.metadata) {
        eta_.StepWith(event.metadata->ack_bytes);
      }
      return SetState(OutboundTransferState::kOngoingTransfer);
    case ProtocolState::kDisconnected:
    case ProtocolState::kRejected:
      return SetState(OutboundTransferState::kFailed);
    case ProtocolState::kCancelled:
      // Back to idle so the user can send again.
      last_event_.reset();
      return SetState(OutboundTransferState::kAwaitingConsentOrIdle);
    case ProtocolState::kFinished:
      return SetState(OutboundTransferState::kDone);
    default:
      VLOG(1) << __func__ << ": No transition for "
              << ProtocolStateToString(event.state) << " on " << id();
      return OutboundStateChange{state_, state_};
  }
}

OutboundStateChange OutboundSession::MarkQueued() {
  return SetState(OutboundTransferState::kQueued);
}

OutboundStateChange OutboundSession::MarkFailed() {
  return SetState(OutboundTransferState::kFailed);
}

OutboundStateChange OutboundSession::SetState(OutboundTransferState state) {
  OutboundStateChange change{state_, state};
  state_ = state;
  return change;
}

std::string OutboundSession::ToString() const {
  return absl::StrCat("OutboundSession<", endpoint_info_.ToString(),
                      ", state: ", OutboundTransferStateToString(state_),
                      ", files: ", files_.size(), ">");
}

}  // namespace sharing
}  // namespace packet
