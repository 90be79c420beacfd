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

#ifndef PACKET_SHARING_DISCOVERY_REGISTRY_H_
#define PACKET_SHARING_DISCOVERY_REGISTRY_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "sharing/endpoint_info.h"
#include "sharing/outbound_registry.h"

namespace packet {
namespace sharing {

// Keeps the latest record of every endpoint seen on the discovery feed and
// makes sure each one has exactly one outbound session.
class DiscoveryRegistry {
 public:
  DiscoveryRegistry(
      OutboundRegistry* outbound_registry,
      absl::AnyInvocable<void(const EndpointInfo&)> endpoint_discovered_callback,
      absl::AnyInvocable<void(const EndpointInfo&)> endpoint_updated_callback);

  // Upserts `endpoint_info`. A record with a known id replaces the previous
  // one, presence included.
  void OnEndpointDiscovered(const EndpointInfo& endpoint_info)
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Forgets endpoints whose sessions were dropped, so that the next discovery
  // reports them as new.
  void Forget(const std::vector<std::string>& ids) ABSL_LOCKS_EXCLUDED(mutex_);

  std::optional<EndpointInfo> Get(absl::string_view id) const
      ABSL_LOCKS_EXCLUDED(mutex_);

  size_t size() const ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  OutboundRegistry& outbound_registry_;
  absl::AnyInvocable<void(const EndpointInfo&)> endpoint_discovered_callback_;
  absl::AnyInvocable<void(const EndpointInfo&)> endpoint_updated_callback_;
  mutable absl::Mutex mutex_;
  absl::flat_hash_map<std::string, EndpointInfo> endpoints_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_DISCOVERY_REGISTRY_H_
