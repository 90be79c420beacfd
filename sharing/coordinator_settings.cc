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

#include "sharing/coordinator_settings.h"

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "google/protobuf/text_format.h"
#include "sharing/proto/settings.pb.h"

namespace packet {
namespace sharing {

proto::CoordinatorSettings DefaultSettings(absl::string_view device_name,
                                           absl::string_view download_folder) {
  proto::CoordinatorSettings settings;
  settings.set_device_name(std::string(device_name));
  settings.set_visibility(proto::DEVICE_VISIBILITY_VISIBLE);
  settings.set_download_folder(std::string(download_folder));
  settings.set_static_port(0);
  return settings;
}

absl::StatusOr<proto::CoordinatorSettings> ParseSettings(
    absl::string_view text) {
  proto::CoordinatorSettings settings;
  if (!google::protobuf::TextFormat::ParseFromString(std::string(text),
                                                     &settings)) {
    return absl::InvalidArgumentError("Malformed coordinator settings");
  }
  absl::Status status = ValidateSettings(settings);
  if (!status.ok()) {
    return status;
  }
  return settings;
}

absl::Status ValidateSettings(const proto::CoordinatorSettings& settings) {
  if (settings.device_name().empty()) {
    return absl::InvalidArgumentError("Device name is empty");
  }
  if (settings.download_folder().empty()) {
    return absl::InvalidArgumentError("Download folder is empty");
  }
  if (settings.static_port() > kMaxPort) {
    return absl::InvalidArgumentError(
        absl::StrCat("Port ", settings.static_port(), " is out of range"));
  }
  return absl::OkStatus();
}

proto::DeviceVisibility ToDeviceVisibility(bool visible) {
  return visible ? proto::DEVICE_VISIBILITY_VISIBLE
                 : proto::DEVICE_VISIBILITY_INVISIBLE;
}

std::string DeviceVisibilityToString(proto::DeviceVisibility visibility) {
  switch (visibility) {
    case proto::DEVICE_VISIBILITY_UNSPECIFIED:
      return "Unspecified";
    case proto::DEVICE_VISIBILITY_VISIBLE:
      return "Visible";
    case proto::DEVICE_VISIBILITY_INVISIBLE:
      return "Invisible";
    case proto::DEVICE_VISIBILITY_TEMPORARILY_VISIBLE:
      return "TemporarilyVisible";
    default:
      return "Unknown";
  }
}

}  // namespace sharing
}  // namespace packet
