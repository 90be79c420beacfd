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

#ifndef PACKET_SHARING_PROTOCOL_EVENT_H_
#define PACKET_SHARING_PROTOCOL_EVENT_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "absl/strings/string_view.h"

namespace packet {
namespace sharing {

// Transfer phases reported by the protocol engine.
enum class ProtocolState {
  kInitial,
  // Receiving side.
  kReceivedConnectionRequest,
  kSentUkeyServerInit,
  kReceivedUkeyClientFinish,
  kSentConnectionResponse,
  kSentPairedKeyResult,
  kReceivedPairedKeyResult,
  kWaitingForUserConsent,
  kReceivingFiles,
  // Sending side.
  kSentUkeyClientInit,
  kSentUkeyClientFinish,
  kSentIntroduction,
  kSendingFiles,
  // Either side.
  kDisconnected,
  kRejected,
  kCancelled,
  kFinished,
};

enum class Direction {
  kInbound,
  kOutbound,
};

enum class PayloadKind {
  kFiles,
  kText,
  kUrl,
  kWifi,
};

// Actions sent to the engine on behalf of the user.
enum class TransferAction {
  kConsentAccept,
  kConsentDecline,
  kTransferCancel,
};

struct TransferPayload {
  PayloadKind kind = PayloadKind::kFiles;
  std::vector<std::string> files;
  // Text or URL content.
  std::string text;
  std::string wifi_ssid;
  std::string wifi_password;
};

struct EventMetadata {
  int64_t total_bytes = 0;
  int64_t ack_bytes = 0;
  std::optional<std::string> pin_code;
  std::optional<std::string> source_name;
  PayloadKind payload_kind = PayloadKind::kFiles;
  std::optional<TransferPayload> payload;
  std::optional<std::string> payload_preview;
};

// A transfer state update for one transfer id.
struct ProtocolEvent {
  std::string ToString() const;

  // Sender's device name, or a placeholder.
  std::string DeviceName() const;

  // Files carried by the transfer, nullptr for text-like payloads.
  const std::vector<std::string>* Files() const;

  bool IsTextPayload() const;

  // Text, URL or "ssid: password" for text-like payloads.
  std::optional<std::string> TransferredText() const;

  std::string id;
  Direction direction = Direction::kInbound;
  ProtocolState state = ProtocolState::kInitial;
  std::optional<EventMetadata> metadata;
};

// Engine bookkeeping with no client-visible state.
struct InternalMessage {
  std::string id;
  std::optional<TransferAction> action;
};

using EngineMessage = std::variant<ProtocolEvent, InternalMessage>;

bool IsTerminalState(ProtocolState state);

std::string ProtocolStateToString(ProtocolState state);
std::string DirectionToString(Direction direction);
std::string TransferActionToString(TransferAction action);

// Some senders wrap shared text as "\"<text>\"\n". Strips that wrapping.
std::string CleanTextPayload(absl::string_view text);

// First line of the cleaned text with stray quotes and newlines trimmed.
std::string CleanPreviewText(absl::string_view text);

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_PROTOCOL_EVENT_H_
