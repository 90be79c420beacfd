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

#ifndef PACKET_SHARING_INBOUND_SLOT_H_
#define PACKET_SHARING_INBOUND_SLOT_H_

#include <optional>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "sharing/inbound_session.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

// Holds the single inbound transfer the protocol allows at a time.
//
// A session leaves the slot only through a terminal engine event carrying its
// own transfer id, or through Release() on shutdown.
//
// All methods are thread-safe. Reads return copies.
class InboundSlot {
 public:
  // Fails with FailedPrecondition if another transfer occupies the slot.
  absl::Status Open(InboundSession session) ABSL_LOCKS_EXCLUDED(mutex_);

  // Applies an inbound event. Returns NotFound if the slot is empty or holds
  // a different transfer. The returned session is the updated one; it has
  // already been released if the event was terminal.
  absl::StatusOr<InboundSession> ApplyEvent(const ProtocolEvent& event)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Records the user's answer for `transfer_id`.
  absl::StatusOr<InboundSession> SetUserAction(absl::string_view transfer_id,
                                               UserAction action)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Declines `transfer_id` if the user has not answered and nothing has
  // cancelled its auto-decline. Fails with FailedPrecondition otherwise.
  absl::StatusOr<InboundSession> DeclineIfUnanswered(
      absl::string_view transfer_id) ABSL_LOCKS_EXCLUDED(mutex_);

  std::optional<InboundSession> Get() const ABSL_LOCKS_EXCLUDED(mutex_);

  // Empties the slot regardless of the transfer state.
  std::optional<InboundSession> Release() ABSL_LOCKS_EXCLUDED(mutex_);

  bool IsOccupied() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  mutable absl::Mutex mutex_;
  std::optional<InboundSession> session_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_INBOUND_SLOT_H_
