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

#ifndef PACKET_SHARING_CONSTANTS_H_
#define PACKET_SHARING_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

#include "absl/time/time.h"

namespace packet {
namespace sharing {

// An inbound request is declined if the user does not answer in time.
constexpr absl::Duration kAutoDeclineTimeout = absl::Seconds(60);

// How long a relay loop waits on its feed before checking for cancellation.
constexpr absl::Duration kRelayPollInterval = absl::Milliseconds(100);

// Upper bound for a blocking engine Stop().
constexpr absl::Duration kEngineStopTimeout = absl::Seconds(10);

// Capacity of the engine's event and discovery broadcast feeds.
constexpr size_t kBroadcastChannelCapacity = 10;

// Events are handed to the service thread one at a time.
constexpr size_t kForwardingQueueCapacity = 1;

constexpr uint32_t kRuntimeThreadCount = 4;

// Number of per-second samples used to average the transfer speed.
constexpr size_t kEtaHistoryCapacity = 5;

constexpr absl::Duration kEtaSampleInterval = absl::Seconds(1);

// Above these bounds the estimate switches to a coarser unit.
constexpr int64_t kEtaHoursThresholdSeconds = 6000;
constexpr int64_t kEtaMinutesThresholdSeconds = 100;

constexpr char kUnknownDeviceName[] = "Unknown device";

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_CONSTANTS_H_
