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

#ifndef PACKET_SHARING_INBOUND_SESSION_H_
#define PACKET_SHARING_INBOUND_SESSION_H_

#include <memory>
#include <optional>
#include <string>

#include "absl/status/status.h"
#include "internal/platform/cancellation_flag.h"
#include "internal/platform/clock.h"
#include "sharing/eta_estimator.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

enum class UserAction {
  kConsentAccept,
  kConsentDecline,
  kTransferCancel,
};

std::string UserActionToString(UserAction action);
TransferAction ToTransferAction(UserAction action);

// What the user currently sees for the inbound transfer.
enum class InboundView {
  kConsent,
  kProgress,
  kClosed,
};

std::string InboundViewToString(InboundView view);

// The transfer a remote device is pushing to us. Created when the engine asks
// for consent and kept until the transfer reaches a terminal state.
//
// Copies share the auto-decline cancellation flag.
class InboundSession {
 public:
  InboundSession(const Clock* clock, ProtocolEvent event,
                 std::string notification_id);

  const std::string& transfer_id() const { return transfer_id_; }
  const std::string& notification_id() const { return notification_id_; }
  const ProtocolEvent& last_event() const { return last_event_; }
  std::optional<UserAction> user_action() const { return user_action_; }
  bool user_cancelled() const { return user_cancelled_; }
  InboundView view() const { return view_; }
  const EtaEstimator& eta() const { return eta_; }

  // Cancelled as soon as the user answers or the engine moves the transfer
  // on. The auto-decline timer only acts while it is not cancelled.
  const std::shared_ptr<CancellationFlag>& auto_decline() const {
    return auto_decline_;
  }

  // True when the auto-decline timer may still decline this request.
  bool IsAwaitingConsent() const;

  // Records the user's answer. Accept and Decline are only valid before any
  // answer, TransferCancel only after Accept.
  absl::Status SetUserAction(UserAction action);

  // Records a follow-up engine event for this transfer. Returns true if the
  // event ends the transfer.
  bool ApplyEvent(const ProtocolEvent& event);

  std::string ToString() const;

 private:
  std::string transfer_id_;
  std::string notification_id_;
  ProtocolEvent last_event_;
  std::optional<UserAction> user_action_;
  bool user_cancelled_ = false;
  InboundView view_ = InboundView::kConsent;
  EtaEstimator eta_;
  std::shared_ptr<CancellationFlag> auto_decline_;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_INBOUND_SESSION_H_
