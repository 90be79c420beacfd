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

#include "sharing/transfer_notifications.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "sharing/desktop_notifier.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {
namespace {

// Cuts `text` to at most `length` bytes without splitting a UTF-8 sequence.
absl::string_view TruncateUtf8(absl::string_view text, size_t length) {
  if (text.size() <= length) {
    return text;
  }
  size_t end = length;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
    --end;
  }
  return text.substr(0, end);
}

std::string ReceivedTextPreview(absl::string_view text) {
  if (text.size() > kReceivedTextPreviewLength) {
    return absl::StrCat(TruncateUtf8(text, kReceivedTextPreviewLength), "...");
  }
  return std::string(text);
}

// Text as shown to the user. Plain text may come wrapped in quotes.
std::string DisplayedText(const ProtocolEvent& event) {
  std::optional<std::string> text = event.TransferredText();
  if (!text.has_value()) {
    return "";
  }
  if (event.metadata->payload->kind == PayloadKind::kText) {
    return CleanTextPayload(*text);
  }
  return *text;
}

}  // namespace

std::string DescribePayload(const ProtocolEvent& event) {
  if (const std::vector<std::string>* files = event.Files()) {
    return absl::StrFormat("%d %s", files->size(),
                           files->size() == 1 ? "File" : "Files");
  }
  std::string preview;
  if (event.metadata && event.metadata->payload_preview) {
    preview = CleanPreviewText(*event.metadata->payload_preview);
  }
  return absl::StrCat("\"", preview, "\"");
}

Notification IncomingRequestNotification(const ProtocolEvent& event) {
  Notification notification;
  notification.title = "Incoming Transfer";
  notification.body = absl::StrCat(event.DeviceName(), " wants to share ",
                                   DescribePayload(event));
  notification.persistent = true;
  notification.default_action = std::string(kConsentAcceptAction);
  notification.buttons.push_back(
      {"Decline", std::string(kConsentDeclineAction), std::nullopt});
  notification.buttons.push_back(
      {"Accept", std::string(kConsentAcceptAction), std::nullopt});
  return notification;
}

Notification ReceivingNotification(const ProtocolEvent& event) {
  Notification notification;
  notification.title = event.DeviceName();
  notification.body = "Receiving...";
  notification.persistent = true;
  notification.buttons.push_back(
      {"Cancel", std::string(kTransferCancelAction), std::nullopt});
  return notification;
}

Notification NoticeNotification(const ProtocolEvent& event,
                                absl::string_view body) {
  Notification notification;
  notification.title = event.DeviceName();
  notification.body = std::string(body);
  return notification;
}

Notification ReceivedNotification(const ProtocolEvent& event,
                                  absl::string_view download_folder) {
  Notification notification;
  notification.title = event.DeviceName();
  notification.show_as_new = true;
  if (event.TransferredText().has_value()) {
    std::string text = DisplayedText(event);
    notification.body =
        absl::StrCat("Received \"", ReceivedTextPreview(text), "\"");
    notification.default_action = std::string(kCopyTextAction);
    notification.default_action_target = text;
    notification.buttons.push_back(
        {"Copy", std::string(kCopyTextAction), text});
    return notification;
  }
  const std::vector<std::string>* files = event.Files();
  notification.body = FilesReceivedMessage(files ? files->size() : 0);
  notification.default_action = std::string(kOpenFolderAction);
  notification.default_action_target = std::string(download_folder);
  notification.buttons.push_back({"Open", std::string(kOpenFolderAction),
                                  std::string(download_folder)});
  return notification;
}

std::string FilesReceivedMessage(size_t file_count) {
  return absl::StrFormat("%d %s received", file_count,
                         file_count == 1 ? "file" : "files");
}

}  // namespace sharing
}  // namespace packet
