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

#ifndef PACKET_INTERNAL_PLATFORM_CANCELLATION_FLAG_H_
#define PACKET_INTERNAL_PLATFORM_CANCELLATION_FLAG_H_

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_set.h"
#include "absl/functional/any_invocable.h"
#include "absl/synchronization/mutex.h"

namespace packet {

// A flag that can be set once to signal cancellation of an operation.
// Cancelling is idempotent and never waits for the cancelled work.
class CancellationFlag {
 public:
  // The listener for cancellation.
  using CancelListener = absl::AnyInvocable<void()>;

  CancellationFlag() = default;
  explicit CancellationFlag(bool cancelled);
  CancellationFlag(const CancellationFlag&) = delete;
  CancellationFlag& operator=(const CancellationFlag&) = delete;
  ~CancellationFlag();

  // Set the flag as cancelled. Registered listeners run on the calling thread
  // the first time only.
  void Cancel() ABSL_LOCKS_EXCLUDED(mutex_);

  // Returns true if the flag has been set to cancelled.
  bool Cancelled() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  friend class CancellationFlagListener;

  // Listeners are registered through `CancellationFlagListener`, which owns
  // the callback and unregisters it on destruction.
  void RegisterOnCancelListener(CancelListener* listener)
      ABSL_LOCKS_EXCLUDED(mutex_);
  void UnregisterOnCancelListener(CancelListener* listener)
      ABSL_LOCKS_EXCLUDED(mutex_);

  mutable absl::Mutex mutex_;
  bool cancelled_ ABSL_GUARDED_BY(mutex_) = false;
  absl::flat_hash_set<CancelListener*> listeners_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace packet

#endif  // PACKET_INTERNAL_PLATFORM_CANCELLATION_FLAG_H_
