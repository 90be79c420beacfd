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

#ifndef PACKET_SHARING_TRANSFER_NOTIFICATIONS_H_
#define PACKET_SHARING_TRANSFER_NOTIFICATIONS_H_

#include <cstddef>
#include <string>

#include "absl/strings/string_view.h"
#include "sharing/desktop_notifier.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

inline constexpr absl::string_view kUnexpectedDisconnectionMessage =
    "Unexpected disconnection";
inline constexpr absl::string_view kCancelledBySenderMessage =
    "Transfer cancelled by sender";
inline constexpr absl::string_view kRequestTimedOutMessage =
    "Request timed out";

// Received text longer than this is cut in the notification body.
constexpr size_t kReceivedTextPreviewLength = 48;

// "3 Files", or the quoted text preview for text-like payloads.
std::string DescribePayload(const ProtocolEvent& event);

// Consent request with Decline and Accept buttons.
Notification IncomingRequestNotification(const ProtocolEvent& event);

// Shown once the user accepted. Offers Cancel.
Notification ReceivingNotification(const ProtocolEvent& event);

// Plain message from the sending device, e.g. a disconnection.
Notification NoticeNotification(const ProtocolEvent& event,
                                absl::string_view body);

// Final notification of a finished transfer: copy for text-like payloads,
// open `download_folder` for files.
Notification ReceivedNotification(const ProtocolEvent& event,
                                  absl::string_view download_folder);

// "1 file received", "4 files received".
std::string FilesReceivedMessage(size_t file_count);

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_TRANSFER_NOTIFICATIONS_H_
