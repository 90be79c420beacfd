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
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "sharing/inbound_session.h"
#include "sharing/internal/public/logging.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

absl::Status InboundSlot::Open(InboundSession session) {
  absl::MutexLock lock(&mutex_);
  if (session_.has_value()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Inbound slot is held by ", session_->transfer_id(),
                     ", refusing ", session.transfer_id()));
  }
  LOG(INFO) << __func__ << ": " << session.ToString();
  session_ = std::move(session);
  return absl::OkStatus();
}

absl::StatusOr<InboundSession> InboundSlot::ApplyEvent(
    const ProtocolEvent& event) {
  absl::MutexLock lock(&mutex_);
  if (!session_.has_value() || session_->transfer_id() != event.id) {
    return absl::NotFoundError(
        absl::StrCat("No inbound session for ", event.id));
  }
  bool ended = session_->ApplyEvent(event);
  InboundSession updated = *session_;
  if (ended) {
    LOG(INFO) << __func__ << ": Releasing " << updated.ToString();
    session_.reset();
  }
  return updated;
}

absl::StatusOr<InboundSession> InboundSlot::SetUserAction(
    absl::string_view transfer_id, UserAction action) {
  absl::MutexLock lock(&mutex_);
  if (!session_.has_value() || session_->transfer_id() != transfer_id) {
    return absl::NotFoundError(
        absl::StrCat("No inbound session for ", transfer_id));
  }
  absl::Status status = session_->SetUserAction(action);
  if (!status.ok()) {
    return status;
  }
  return *session_;
}

absl::StatusOr<InboundSession> InboundSlot::DeclineIfUnanswered(
    absl::string_view transfer_id) {
  absl::MutexLock lock(&mutex_);
  if (!session_.has_value() || session_->transfer_id() != transfer_id) {
    return absl::NotFoundError(
        absl::StrCat("No inbound session for ", transfer_id));
  }
  if (!session_->IsAwaitingConsent()) {
    return absl::FailedPreconditionError(
        absl::StrCat("Transfer ", transfer_id, " no longer awaits consent"));
  }
  absl::Status status = session_->SetUserAction(UserAction::kConsentDecline);
  if (!status.ok()) {
    return status;
  }
  return *session_;
}

std::optional<InboundSession> InboundSlot::Get() const {
  absl::MutexLock lock(&mutex_);
  return session_;
}

std::optional<InboundSession> InboundSlot::Release() {
  absl::MutexLock lock(&mutex_);
  std::optional<InboundSession> session = std::move(session_);
  session_.reset();
  return session;
}

bool InboundSlot::IsOccupied() const {
  absl::MutexLock lock(&mutex_);
  return session_.has_value();
}

}  // namespace sharing
}  // namespace packet
