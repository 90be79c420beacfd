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

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "sharing/proto/settings.pb.h"

namespace packet {
namespace sharing {
namespace {

TEST(CoordinatorSettingsTest, DefaultSettingsAreValid) {
  proto::CoordinatorSettings settings =
      DefaultSettings("Pixel Desktop", "/home/user/Downloads");

  EXPECT_TRUE(ValidateSettings(settings).ok());
  EXPECT_EQ(settings.visibility(), proto::DEVICE_VISIBILITY_VISIBLE);
  EXPECT_EQ(settings.static_port(), 0u);
}

TEST(CoordinatorSettingsTest, ParseTextFormat) {
  absl::StatusOr<proto::CoordinatorSettings> settings = ParseSettings(R"pb(
    device_name: "Living Room PC"
    visibility: DEVICE_VISIBILITY_INVISIBLE
    download_folder: "/tmp/packet"
    static_port: 9300
  )pb");

  ASSERT_TRUE(settings.ok());
  EXPECT_EQ(settings->device_name(), "Living Room PC");
  EXPECT_EQ(settings->visibility(), proto::DEVICE_VISIBILITY_INVISIBLE);
  EXPECT_EQ(settings->download_folder(), "/tmp/packet");
  EXPECT_EQ(settings->static_port(), 9300u);
}

TEST(CoordinatorSettingsTest, ParseMalformedText) {
  absl::StatusOr<proto::CoordinatorSettings> settings =
      ParseSettings("device_name: ");

  EXPECT_EQ(settings.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CoordinatorSettingsTest, ParseUnknownField) {
  absl::StatusOr<proto::CoordinatorSettings> settings =
      ParseSettings("device_colour: \"blue\"");

  EXPECT_EQ(settings.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(CoordinatorSettingsTest, RejectEmptyDeviceName) {
  proto::CoordinatorSettings settings = DefaultSettings("", "/tmp");

  EXPECT_EQ(ValidateSettings(settings).code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(CoordinatorSettingsTest, RejectEmptyDownloadFolder) {
  proto::CoordinatorSettings settings = DefaultSettings("Desk", "");

  EXPECT_EQ(ValidateSettings(settings).code(),
            absl::StatusCode::kInvalidArgument);
}

TEST(CoordinatorSettingsTest, RejectPortOutOfRange) {
  proto::CoordinatorSettings settings = DefaultSettings("Desk", "/tmp");
  settings.set_static_port(65536);

  EXPECT_EQ(ValidateSettings(settings).code(),
            absl::StatusCode::kInvalidArgument);

  settings.set_static_port(65535);
  EXPECT_TRUE(ValidateSettings(settings).ok());
}

TEST(CoordinatorSettingsTest, ToDeviceVisibility) {
  EXPECT_EQ(ToDeviceVisibility(true), proto::DEVICE_VISIBILITY_VISIBLE);
  EXPECT_EQ(ToDeviceVisibility(false), proto::DEVICE_VISIBILITY_INVISIBLE);
  EXPECT_EQ(DeviceVisibilityToString(proto::DEVICE_VISIBILITY_INVISIBLE),
            "Invisible");
}

}  // namespace
}  // namespace sharing
}  // namespace packet
