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

#ifndef PACKET_SHARING_ENDPOINT_INFO_H_
#define PACKET_SHARING_ENDPOINT_INFO_H_

#include <cstdint>
#include <optional>
#include <string>

namespace packet {
namespace sharing {

// A remote device reported by the engine's discovery feed.
struct EndpointInfo {
  std::string ToString() const;

  // Name to show for the endpoint, falls back to a placeholder.
  std::string DisplayName() const;

  // "address:port", or nullopt if the endpoint has not been resolved yet.
  std::optional<std::string> SocketAddress() const;

  std::string id;
  std::optional<std::string> name;
  std::optional<std::string> address;
  std::optional<uint16_t> port;
  // Unset when the discovery feed did not report presence.
  std::optional<bool> present;
};

bool operator==(const EndpointInfo& lhs, const EndpointInfo& rhs);
bool operator!=(const EndpointInfo& lhs, const EndpointInfo& rhs);

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_ENDPOINT_INFO_H_
