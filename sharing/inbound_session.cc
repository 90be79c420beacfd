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

#include "sharing/inbound_session.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "internal/platform/cancellation_flag.h"
#include "internal/platform/clock.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

int64_t TotalBytes(const ProtocolEvent& event) {
  return event.metadata ? event.metadata->total_bytes : 0;
}

}  // namespace

std::string UserActionToString(UserAction action) {
  switch (action) {
    case UserAction::kConsentAccept:
      return "kConsentAccept";
    case UserAction::kConsentDecline:
      return "kConsentDecline";
    case UserAction::kTransferCancel:
      return "kTransferCancel";
  }
  return "kUnknown";
}

TransferAction ToTransferAction(UserAction action) {
  switch (action) {
    case UserAction::kConsentAccept:
      return TransferAction::kConsentAccept;
    case UserAction::kConsentDecline:
      return TransferAction::kConsentDecline;
    case UserAction::kTransferCancel:
      return TransferAction::kTransferCancel;
  }
  return TransferAction::kConsentDecline;
}

std::string InboundViewToString(InboundView view) {
  switch (view) {
    case InboundView::kConsent:
      return "kConsent";
    case InboundView::kProgress:
      return "kProgress";
    case InboundView::kClosed:
      return "kClosed";
  }
  return "kUnknown";
}

InboundSession::InboundSession(const Clock* clock, ProtocolEvent event,
                               std::string notification_id)
    : transfer_id_(event.id),
      notification_id_(std::move(notification_id)),
      last_event_(std::move(event)),
      eta_(clock, TotalBytes(last_event_)),
      auto_decline_(std::make_shared<CancellationFlag>()) {}

bool InboundSession::IsAwaitingConsent() const {
  return !user_action_.has_value() && !auto_decline_->Cancelled();
}

absl::Status InboundSession::SetUserAction(UserAction action) {
  switch (action) {
    case UserAction::kConsentAccept:
    case UserAction::kConsentDecline:
      if (user_action_.has_value()) {
        return absl::FailedPreconditionError(
            absl::StrCat("Transfer ", transfer_id_, " already answered with ",
                         UserActionToString(*user_action_)));
      }
      auto_decline_->Cancel();
      view_ = action == UserAction::kConsentAccept ? InboundView::kProgress
                                                   : InboundView::kClosed;
      break;
    case UserAction::kTransferCancel:
      if (user_action_ != UserAction::kConsentAccept) {
        return absl::FailedPreconditionError(absl::StrCat(
            "Transfer ", transfer_id_, " cannot be cancelled before accept"));
      }
      user_cancelled_ = true;
      break;
  }
  user_action_ = action;
  return absl::OkStatus();
}

bool InboundSession::ApplyEvent(const ProtocolEvent& event) {
  if (event.state != ProtocolState::kWaitingForUserConsent) {
    auto_decline_->Cancel();
  }
  // Later events may omit the metadata announced with the consent request.
  std::optional<EventMetadata> previous_metadata =
      std::move(last_event_.metadata);
  last_event_ = event;
  if (!last_event_.metadata.has_value()) {
    last_event_.metadata = std::move(previous_metadata);
  }

  if (event.state == ProtocolState::kReceivingFiles && event.metadata) {
    eta_.StepWith(event.metadata->ack_bytes);
  }

  if (IsTerminalState(event.state)) {
    view_ = InboundView::kClosed;
    return true;
  }
  return false;
}

std::string InboundSession::ToString() const {
  return absl::StrCat(
      "InboundSession<id: ", transfer_id_,
      ", state: ", ProtocolStateToString(last_event_.state), ", action: ",
      user_action_ ? UserActionToString(*user_action_) : "unset",
      ", view: ", InboundViewToString(view_), ">");
}

}  // namespace sharing
}  // namespace packet
