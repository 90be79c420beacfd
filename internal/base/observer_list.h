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

#ifndef PACKET_INTERNAL_BASE_OBSERVER_LIST_H_
#define PACKET_INTERNAL_BASE_OBSERVER_LIST_H_

#include <algorithm>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/functional/function_ref.h"
#include "absl/synchronization/mutex.h"

namespace packet {

// Observers in registration order. Adding an observer twice is a no-op.
//
// This class is thread-safe. Notify() works on a snapshot, so observers may
// add or remove observers from their callbacks; a removed observer can still
// get the notification in flight.
template <class ObserverType>
class ObserverList {
 public:
  void AddObserver(ObserverType* observer) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    if (std::find(observers_.begin(), observers_.end(), observer) ==
        observers_.end()) {
      observers_.push_back(observer);
    }
  }

  void RemoveObserver(ObserverType* observer) ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
  }

  bool HasObserver(ObserverType* observer) const ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    return std::find(observers_.begin(), observers_.end(), observer) !=
           observers_.end();
  }

  void Clear() ABSL_LOCKS_EXCLUDED(mutex_) {
    absl::MutexLock lock(&mutex_);
    observers_.clear();
  }

  // Calls `notify` for every observer, outside of the lock.
  void Notify(absl::FunctionRef<void(ObserverType*)> notify) const
      ABSL_LOCKS_EXCLUDED(mutex_) {
    std::vector<ObserverType*> snapshot;
    {
      absl::MutexLock lock(&mutex_);
      snapshot = observers_;
    }
    for (ObserverType* observer : snapshot) {
      notify(observer);
    }
  }

 private:
  mutable absl::Mutex mutex_;
  std::vector<ObserverType*> observers_ ABSL_GUARDED_BY(mutex_);
};

}  // namespace packet

#endif  // PACKET_INTERNAL_BASE_OBSERVER_LIST_H_
