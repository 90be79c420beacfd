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

#ifndef PACKET_SHARING_MOCK_DESKTOP_NOTIFIER_H_
#define PACKET_SHARING_MOCK_DESKTOP_NOTIFIER_H_

#include "gmock/gmock.h"
#include "absl/strings/string_view.h"
#include "sharing/desktop_notifier.h"

namespace packet {
namespace sharing {

class MockDesktopNotifier : public DesktopNotifier {
 public:
  ~MockDesktopNotifier() override = default;

  MOCK_METHOD(void, Show,
              (absl::string_view id, const Notification& notification),
              (override));
  MOCK_METHOD(void, Withdraw, (absl::string_view id), (override));
  MOCK_METHOD(void, ShowToast, (absl::string_view text), (override));
  MOCK_METHOD(void, OpenFolder, (absl::string_view path), (override));
  MOCK_METHOD(void, CopyToClipboard, (absl::string_view text), (override));
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_MOCK_DESKTOP_NOTIFIER_H_
