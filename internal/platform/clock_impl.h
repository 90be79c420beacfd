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

#ifndef PACKET_INTERNAL_PLATFORM_CLOCK_IMPL_H_
#define PACKET_INTERNAL_PLATFORM_CLOCK_IMPL_H_

#include "absl/time/time.h"
#include "internal/platform/clock.h"

namespace packet {

// Wall clock.
class ClockImpl : public Clock {
 public:
  ClockImpl() = default;
  ~ClockImpl() override = default;

  absl::Time Now() const override;
};

}  // namespace packet

#endif  // PACKET_INTERNAL_PLATFORM_CLOCK_IMPL_H_
