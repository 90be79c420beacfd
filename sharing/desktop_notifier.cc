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

#include "sharing/desktop_notifier.h"

namespace packet {
namespace sharing {

bool operator==(const NotificationButton& lhs, const NotificationButton& rhs) {
  return lhs.label == rhs.label && lhs.action == rhs.action &&
         lhs.target == rhs.target;
}

bool operator==(const Notification& lhs, const Notification& rhs) {
  return lhs.title == rhs.title && lhs.body == rhs.body &&
         lhs.persistent == rhs.persistent &&
         lhs.show_as_new == rhs.show_as_new &&
         lhs.default_action == rhs.default_action &&
         lhs.default_action_target == rhs.default_action_target &&
         lhs.buttons == rhs.buttons;
}

}  // namespace sharing
}  // namespace packet
