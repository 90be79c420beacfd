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

#include "sharing/endpoint_info.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "sharing/constants.h"

namespace packet {
namespace sharing {

std::string EndpointInfo::ToString() const {
  std::vector<std::string> fmt;

  fmt.push_back(absl::StrFormat("id: %s", id));
  if (name) {
    fmt.push_back(absl::StrFormat("name: %s", *name));
  }
  if (std::optional<std::string> socket_address = SocketAddress()) {
    fmt.push_back(absl::StrFormat("address: %s", *socket_address));
  }
  if (present) {
    fmt.push_back(
        absl::StrFormat("present: %s", *present ? "true" : "false"));
  }

  return absl::StrCat("EndpointInfo<", absl::StrJoin(fmt, ", "), ">");
}

std::string EndpointInfo::DisplayName() const {
  if (name.has_value() && !name->empty()) {
    return *name;
  }
  return kUnknownDeviceName;
}

std::optional<std::string> EndpointInfo::SocketAddress() const {
  if (!address.has_value() || !port.has_value()) {
    return std::nullopt;
  }
  return absl::StrCat(*address, ":", *port);
}

bool operator==(const EndpointInfo& lhs, const EndpointInfo& rhs) {
  return lhs.id == rhs.id && lhs.name == rhs.name &&
         lhs.address == rhs.address && lhs.port == rhs.port &&
         lhs.present == rhs.present;
}

bool operator!=(const EndpointInfo& lhs, const EndpointInfo& rhs) {
  return !(lhs == rhs);
}

}  // namespace sharing
}  // namespace packet
