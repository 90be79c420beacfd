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

#ifndef PACKET_SHARING_DESKTOP_NOTIFIER_H_
#define PACKET_SHARING_DESKTOP_NOTIFIER_H_

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace packet {
namespace sharing {

// Action ids carried by notification buttons. They come back through
// TransferCoordinator::HandleNotificationAction().
inline constexpr absl::string_view kConsentAcceptAction = "consent-accept";
inline constexpr absl::string_view kConsentDeclineAction = "consent-decline";
inline constexpr absl::string_view kTransferCancelAction = "transfer-cancel";
inline constexpr absl::string_view kOpenFolderAction = "open-folder";
inline constexpr absl::string_view kCopyTextAction = "copy-text";

struct NotificationButton {
  std::string label;
  std::string action;
  // Parameter passed back with the action, e.g. the text to copy.
  std::optional<std::string> target;
};

struct Notification {
  std::string title;
  std::string body;
  // Stays on screen until withdrawn.
  bool persistent = false;
  // Replaces the notification with the same id as a new one.
  bool show_as_new = false;
  std::optional<std::string> default_action;
  std::optional<std::string> default_action_target;
  std::vector<NotificationButton> buttons;
};

bool operator==(const NotificationButton& lhs, const NotificationButton& rhs);
bool operator==(const Notification& lhs, const Notification& rhs);

// Desktop notification portal, the in-app toast area and the desktop side of
// notification actions. Calls are fire and forget; failures are logged by the
// implementation.
class DesktopNotifier {
 public:
  virtual ~DesktopNotifier() = default;

  // Adds or replaces the notification `id`.
  virtual void Show(absl::string_view id,
                    const Notification& notification) = 0;

  virtual void Withdraw(absl::string_view id) = 0;

  // Short-lived message inside the application window.
  virtual void ShowToast(absl::string_view text) = 0;

  // Opens `path` in the file manager.
  virtual void OpenFolder(absl::string_view path) = 0;

  virtual void CopyToClipboard(absl::string_view text) = 0;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_DESKTOP_NOTIFIER_H_
