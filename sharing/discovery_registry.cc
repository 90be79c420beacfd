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

#include "sharing/discovery_registry.h"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "sharing/endpoint_info.h"
#include "sharing/internal/public/logging.h"
#include "sharing/outbound_registry.h"

namespace packet {
namespace sharing {

DiscoveryRegistry::DiscoveryRegistry(
    OutboundRegistry* outbound_registry,
    absl::AnyInvocable<void(const EndpointInfo&)> endpoint_discovered_callback,
    absl::AnyInvocable<void(const EndpointInfo&)> endpoint_updated_callback)
    : outbound_registry_(*outbound_registry),
      endpoint_discovered_callback_(std::move(endpoint_discovered_callback)),
      endpoint_updated_callback_(std::move(endpoint_updated_callback)) {}

void DiscoveryRegistry::OnEndpointDiscovered(
    const EndpointInfo& endpoint_info) {
  if (endpoint_info.id.empty()) {
    LOG(WARNING) << __func__ << ": Ignoring endpoint without id.";
    return;
  }
  {
    absl::MutexLock lock(&mutex_);
    endpoints_.insert_or_assign(endpoint_info.id, endpoint_info);
  }
  // The session may have been refreshed away while the endpoint stayed
  // known, so the outbound registry decides what is new.
  if (outbound_registry_.Upsert(endpoint_info)) {
    endpoint_discovered_callback_(endpoint_info);
  } else {
    endpoint_updated_callback_(endpoint_info);
  }
}

void DiscoveryRegistry::Forget(const std::vector<std::string>& ids) {
  absl::MutexLock lock(&mutex_);
  for (const std::string& id : ids) {
    endpoints_.erase(id);
  }
}

std::optional<EndpointInfo> DiscoveryRegistry::Get(absl::string_view id) const {
  absl::MutexLock lock(&mutex_);
  auto it = endpoints_.find(id);
  if (it == endpoints_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t DiscoveryRegistry::size() const {
  absl::MutexLock lock(&mutex_);
  return endpoints_.size();
}

}  // namespace sharing
}  // namespace packet
