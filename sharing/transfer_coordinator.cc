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

#include "sharing/transfer_coordinator.h"

#include <string>

namespace packet {
namespace sharing {

// static
std::string TransferCoordinator::StatusCodeToString(StatusCodes status_code) {
  switch (status_code) {
    case StatusCodes::kOk:
      return "kOk";
    case StatusCodes::kError:
      return "kError";
    case StatusCodes::kInvalidArgument:
      return "kInvalidArgument";
    case StatusCodes::kServiceUnavailable:
      return "kServiceUnavailable";
    case StatusCodes::kTransferAlreadyInProgress:
      return "kTransferAlreadyInProgress";
    case StatusCodes::kNotFound:
      return "kNotFound";
  }
  return "kUnknown";
}

// static
std::string TransferCoordinator::ServiceStateToString(ServiceState state) {
  switch (state) {
    case ServiceState::kStopped:
      return "kStopped";
    case ServiceState::kStarting:
      return "kStarting";
    case ServiceState::kRunning:
      return "kRunning";
    case ServiceState::kUnavailable:
      return "kUnavailable";
  }
  return "kUnknown";
}

}  // namespace sharing
}  // namespace packet
