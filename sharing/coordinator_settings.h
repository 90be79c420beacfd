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

#ifndef PACKET_SHARING_COORDINATOR_SETTINGS_H_
#define PACKET_SHARING_COORDINATOR_SETTINGS_H_

#include <cstdint>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "sharing/proto/settings.pb.h"

namespace packet {
namespace sharing {

// Largest value accepted for `static_port`.
constexpr uint32_t kMaxPort = 65535;

// Settings for a visible device with an engine-chosen port.
proto::CoordinatorSettings DefaultSettings(absl::string_view device_name,
                                           absl::string_view download_folder);

// Parses text format settings and validates them.
absl::StatusOr<proto::CoordinatorSettings> ParseSettings(
    absl::string_view text);

// Rejects an empty device name, an empty download folder and out of range
// ports with InvalidArgument.
absl::Status ValidateSettings(const proto::CoordinatorSettings& settings);

proto::DeviceVisibility ToDeviceVisibility(bool visible);

std::string DeviceVisibilityToString(proto::DeviceVisibility visibility);

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_COORDINATOR_SETTINGS_H_
