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

#ifndef PACKET_SHARING_INTERNAL_PUBLIC_LOGGING_H_
#define PACKET_SHARING_INTERNAL_PUBLIC_LOGGING_H_

// IWYU pragma: begin_exports
#include "absl/log/check.h"
#include "absl/log/log.h"
// IWYU pragma: end_exports

#endif  // PACKET_SHARING_INTERNAL_PUBLIC_LOGGING_H_
