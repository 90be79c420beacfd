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

#ifndef PACKET_SHARING_PROTOCOL_ENGINE_H_
#define PACKET_SHARING_PROTOCOL_ENGINE_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"
#include "sharing/broadcast_channel.h"
#include "sharing/endpoint_info.h"
#include "sharing/proto/settings.pb.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

// Files to push to one resolved endpoint.
struct SendRequest {
  std::string id;
  std::string name;
  // "address:port".
  std::string address;
  std::vector<std::string> files;
};

// The library that implements the wire protocol. Discovery records and
// transfer events are published on broadcast feeds; everything else is a
// call into the engine.
//
// Implementations must be thread-safe.
class ProtocolEngine {
 public:
  virtual ~ProtocolEngine() = default;

  // Starts advertising and accepting connections with `settings`. The feeds
  // returned afterwards belong to this run of the engine.
  virtual absl::Status Start(const proto::CoordinatorSettings& settings) = 0;

  // Stops the engine, waiting at most `timeout`. Closes the feeds.
  virtual absl::Status Stop(absl::Duration timeout) = 0;

  // Transfer events for both directions.
  virtual BroadcastChannel<EngineMessage> messages() = 0;

  // Endpoints found while discovery runs.
  virtual BroadcastChannel<EndpointInfo> discovery() = 0;

  virtual absl::Status StartDiscovery() = 0;
  virtual absl::Status StopDiscovery() = 0;

  virtual absl::Status Send(const SendRequest& request) = 0;

  // Consent and cancel actions for transfer `id`.
  virtual absl::Status SendAction(absl::string_view id,
                                  TransferAction action) = 0;

  virtual absl::Status ChangeVisibility(proto::DeviceVisibility visibility) = 0;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_PROTOCOL_ENGINE_H_
