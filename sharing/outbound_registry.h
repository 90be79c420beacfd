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

#ifndef PACKET_SHARING_OUTBOUND_REGISTRY_H_
#define PACKET_SHARING_OUTBOUND_REGISTRY_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "internal/platform/clock.h"
#include "sharing/endpoint_info.h"
#include "sharing/outbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

// Owns every outbound session, keyed by endpoint id, together with the order
// in which they are presented (most recently discovered first).
//
// All methods are thread-safe. Reads return copies.
class OutboundRegistry {
 public:
  explicit OutboundRegistry(const Clock* clock);

  // Adds a session for a newly discovered endpoint, or refreshes the endpoint
  // snapshot of the existing one. Returns true if a session was added.
  bool Upsert(const EndpointInfo& endpoint_info) ABSL_LOCKS_EXCLUDED(mutex_);

  // Applies an outbound engine event. Returns NotFound if no session has the
  // event's id.
  absl::StatusOr<OutboundStateChange> ApplyEvent(const ProtocolEvent& event)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Stores `files` on the session `id` ahead of a send and marks it Queued if
  // another session holds the transfer slot. Fails with FailedPrecondition if
  // the session itself is already sending.
  absl::StatusOr<OutboundSession> PrepareSend(absl::string_view id,
                                              std::vector<std::string> files,
                                              int64_t total_size)
      ABSL_LOCKS_EXCLUDED(mutex_);

  absl::StatusOr<OutboundStateChange> MarkFailed(absl::string_view id)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Fails every queued or active session, used when the engine goes away
  // under them. Returns the ids of the failed sessions.
  std::vector<std::string> MarkUnfinishedFailed() ABSL_LOCKS_EXCLUDED(mutex_);

  std::optional<OutboundSession> Get(absl::string_view id) const
      ABSL_LOCKS_EXCLUDED(mutex_);

  // True if a session is RequestedForConsent or OngoingTransfer.
  bool HasActiveTransfer() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Drops idle, failed and finished sessions. Returns the removed ids.
  std::vector<std::string> RemoveIdle() ABSL_LOCKS_EXCLUDED(mutex_);

  // Sessions in presentation order.
  std::vector<OutboundSession> List() const ABSL_LOCKS_EXCLUDED(mutex_);

  size_t size() const ABSL_LOCKS_EXCLUDED(mutex_);

  std::string DebugString() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  bool HasActiveTransferLocked() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const Clock* const clock_;
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, OutboundSession> sessions_
      ABSL_GUARDED_BY(mutex_);
  // Ids of `sessions_`, newest first.
  std::vector<std::string> order_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_OUTBOUND_REGISTRY_H_
