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

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "internal/platform/clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/internal/public/logging.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

OutboundRegistry::OutboundRegistry(const Clock* clock) : clock_(clock) {}

bool OutboundRegistry::Upsert(const EndpointInfo& endpoint_info) {
  absl::MutexLock lock(&mutex_);
  auto it = sessions_.find(endpoint_info.id);
  if (it != sessions_.end()) {
    LOG(INFO) << __func__ << ": Updated endpoint " << endpoint_info.ToString();
    it->second.UpdateEndpointInfo(endpoint_info);
    return false;
  }
  LOG(INFO) << __func__ << ": Discovered endpoint " << endpoint_info.ToString();
  sessions_.emplace(endpoint_info.id, OutboundSession(clock_, endpoint_info));
  order_.insert(order_.begin(), endpoint_info.id);
  return true;
}

absl::StatusOr<OutboundStateChange> OutboundRegistry::ApplyEvent(
    const ProtocolEvent& event) {
  absl::MutexLock lock(&mutex_);
  auto it = sessions_.find(event.id);
  if (it == sessions_.end()) {
    return absl::NotFoundError(
        absl::StrCat("No outbound session for ", event.id));
  }
  OutboundStateChange change = it->second.ApplyEvent(event);
  if (change.changed()) {
    LOG(INFO) << __func__ << ": " << event.id << " "
              << OutboundTransferStateToString(change.old_state) << " -> "
              << OutboundTransferStateToString(change.new_state);
  }
  return change;
}

absl::StatusOr<OutboundSession> OutboundRegistry::PrepareSend(
    absl::string_view id, std::vector<std::string> files, int64_t total_size) {
  absl::MutexLock lock(&mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return absl::NotFoundError(absl::StrCat("No outbound session for ", id));
  }
  OutboundSession& session = it->second;
  if (IsActiveOutboundState(session.state()) ||
      session.state() == OutboundTransferState::kQueued) {
    return absl::FailedPreconditionError(
        absl::StrCat("Session ", id, " is already ",
                     OutboundTransferStateToString(session.state())));
  }

  session.SetFiles(std::move(files), total_size);
  // The protocol allows a single transfer at a time. The engine holds the
  // request until the current one ends.
  if (HasActiveTransferLocked()) {
    LOG(INFO) << __func__ << ": Queueing send to " << id;
    session.MarkQueued();
  }
  return session;
}

absl::StatusOr<OutboundStateChange> OutboundRegistry::MarkFailed(
    absl::string_view id) {
  absl::MutexLock lock(&mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return absl::NotFoundError(absl::StrCat("No outbound session for ", id));
  }
  return it->second.MarkFailed();
}

std::vector<std::string> OutboundRegistry::MarkUnfinishedFailed() {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> failed;
  for (const std::string& id : order_) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      continue;
    }
    OutboundTransferState state = it->second.state();
    if (IsActiveOutboundState(state) ||
        state == OutboundTransferState::kQueued) {
      it->second.MarkFailed();
      failed.push_back(id);
    }
  }
  return failed;
}

std::optional<OutboundSession> OutboundRegistry::Get(
    absl::string_view id) const {
  absl::MutexLock lock(&mutex_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool OutboundRegistry::HasActiveTransfer() const {
  absl::MutexLock lock(&mutex_);
  return HasActiveTransferLocked();
}

bool OutboundRegistry::HasActiveTransferLocked() const {
  return std::any_of(sessions_.begin(), sessions_.end(), [](const auto& entry) {
    return IsActiveOutboundState(entry.second.state());
  });
}

std::vector<std::string> OutboundRegistry::RemoveIdle() {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> removed;
  for (const std::string& id : order_) {
    auto it = sessions_.find(id);
    if (it != sessions_.end() && IsRemovableOutboundState(it->second.state())) {
      removed.push_back(id);
      sessions_.erase(it);
    }
  }
  order_.erase(std::remove_if(order_.begin(), order_.end(),
                              [this](const std::string& id) {
                                return !sessions_.contains(id);
                              }),
               order_.end());
  LOG(INFO) << __func__ << ": Removed " << removed.size()
            << " sessions, kept " << sessions_.size();
  return removed;
}

std::vector<OutboundSession> OutboundRegistry::List() const {
  absl::MutexLock lock(&mutex_);
  std::vector<OutboundSession> sessions;
  sessions.reserve(order_.size());
  for (const std::string& id : order_) {
    auto it = sessions_.find(id);
    if (it != sessions_.end()) {
      sessions.push_back(it->second);
    }
  }
  return sessions;
}

size_t OutboundRegistry::size() const {
  absl::MutexLock lock(&mutex_);
  return sessions_.size();
}

std::string OutboundRegistry::DebugString() const {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> lines;
  for (const std::string& id : order_) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
      continue;
    }
    const OutboundSession& session = it->second;
    lines.push_back(absl::StrCat(
        session.ToString(), " last_event: ",
        session.last_event() ? session.last_event()->ToString() : "none"));
  }
  return absl::StrJoin(lines, "\n");
}

}  // namespace sharing
}  // namespace packet
