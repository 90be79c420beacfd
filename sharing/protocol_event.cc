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

#include "sharing/protocol_event.h"

#include <optional>
#include <string>
#include <vector>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "sharing/constants.h"

namespace packet {
namespace sharing {
namespace {

absl::string_view TrimQuotesAndNewlines(absl::string_view text) {
  while (!text.empty() && (text.front() == '"' || text.front() == '\n')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == '"' || text.back() == '\n')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

std::string ProtocolEvent::ToString() const {
  std::vector<std::string> fmt;

  fmt.push_back(absl::StrFormat("id: %s", id));
  fmt.push_back(absl::StrFormat("direction: %s", DirectionToString(direction)));
  fmt.push_back(absl::StrFormat("state: %s", ProtocolStateToString(state)));
  if (metadata) {
    fmt.push_back(absl::StrFormat("total_bytes: %d", metadata->total_bytes));
    fmt.push_back(absl::StrFormat("ack_bytes: %d", metadata->ack_bytes));
    if (metadata->pin_code) {
      fmt.push_back(absl::StrFormat("pin_code: %s", *metadata->pin_code));
    }
  }

  return absl::StrCat("ProtocolEvent<", absl::StrJoin(fmt, ", "), ">");
}

std::string ProtocolEvent::DeviceName() const {
  if (metadata && metadata->source_name) {
    return *metadata->source_name;
  }
  return kUnknownDeviceName;
}

const std::vector<std::string>* ProtocolEvent::Files() const {
  if (!metadata || !metadata->payload ||
      metadata->payload->kind != PayloadKind::kFiles) {
    return nullptr;
  }
  return &metadata->payload->files;
}

bool ProtocolEvent::IsTextPayload() const {
  return metadata && metadata->payload_kind != PayloadKind::kFiles;
}

std::optional<std::string> ProtocolEvent::TransferredText() const {
  if (!metadata || !metadata->payload) {
    return std::nullopt;
  }
  const TransferPayload& payload = *metadata->payload;
  switch (payload.kind) {
    case PayloadKind::kText:
    case PayloadKind::kUrl:
      return payload.text;
    case PayloadKind::kWifi:
      return absl::StrCat(payload.wifi_ssid, ": ", payload.wifi_password);
    case PayloadKind::kFiles:
      return std::nullopt;
  }
  return std::nullopt;
}

bool IsTerminalState(ProtocolState state) {
  switch (state) {
    case ProtocolState::kDisconnected:
    case ProtocolState::kRejected:
    case ProtocolState::kCancelled:
    case ProtocolState::kFinished:
      return true;
    case ProtocolState::kInitial:
    case ProtocolState::kReceivedConnectionRequest:
    case ProtocolState::kSentUkeyServerInit:
    case ProtocolState::kReceivedUkeyClientFinish:
    case ProtocolState::kSentConnectionResponse:
    case ProtocolState::kSentPairedKeyResult:
    case ProtocolState::kReceivedPairedKeyResult:
    case ProtocolState::kWaitingForUserConsent:
    case ProtocolState::kReceivingFiles:
    case ProtocolState::kSentUkeyClientInit:
    case ProtocolState::kSentUkeyClientFinish:
    case ProtocolState::kSentIntroduction:
    case ProtocolState::kSendingFiles:
      return false;
  }
  return false;
}

std::string ProtocolStateToString(ProtocolState state) {
  switch (state) {
    case ProtocolState::kInitial:
      return "kInitial";
    case ProtocolState::kReceivedConnectionRequest:
      return "kReceivedConnectionRequest";
    case ProtocolState::kSentUkeyServerInit:
      return "kSentUkeyServerInit";
    case ProtocolState::kReceivedUkeyClientFinish:
      return "kReceivedUkeyClientFinish";
    case ProtocolState::kSentConnectionResponse:
      return "kSentConnectionResponse";
    case ProtocolState::kSentPairedKeyResult:
      return "kSentPairedKeyResult";
    case ProtocolState::kReceivedPairedKeyResult:
      return "kReceivedPairedKeyResult";
    case ProtocolState::kWaitingForUserConsent:
      return "kWaitingForUserConsent";
    case ProtocolState::kReceivingFiles:
      return "kReceivingFiles";
    case ProtocolState::kSentUkeyClientInit:
      return "kSentUkeyClientInit";
    case ProtocolState::kSentUkeyClientFinish:
      return "kSentUkeyClientFinish";
    case ProtocolState::kSentIntroduction:
      return "kSentIntroduction";
    case ProtocolState::kSendingFiles:
      return "kSendingFiles";
    case ProtocolState::kDisconnected:
      return "kDisconnected";
    case ProtocolState::kRejected:
      return "kRejected";
    case ProtocolState::kCancelled:
      return "kCancelled";
    case ProtocolState::kFinished:
      return "kFinished";
  }
  return "kUnknown";
}

std::string DirectionToString(Direction direction) {
  switch (direction) {
    case Direction::kInbound:
      return "kInbound";
    case Direction::kOutbound:
      return "kOutbound";
  }
  return "kUnknown";
}

std::string TransferActionToString(TransferAction action) {
  switch (action) {
    case TransferAction::kConsentAccept:
      return "kConsentAccept";
    case TransferAction::kConsentDecline:
      return "kConsentDecline";
    case TransferAction::kTransferCancel:
      return "kTransferCancel";
  }
  return "kUnknown";
}

std::string CleanTextPayload(absl::string_view text) {
  if (text.size() >= 3 && absl::StartsWith(text, "\"") &&
      absl::EndsWith(text, "\"\n")) {
    return std::string(text.substr(1, text.size() - 3));
  }
  return std::string(text);
}

std::string CleanPreviewText(absl::string_view text) {
  std::string cleaned = CleanTextPayload(text);
  absl::string_view view = TrimQuotesAndNewlines(cleaned);
  absl::string_view::size_type newline = view.find('\n');
  if (newline != absl::string_view::npos) {
    view = view.substr(0, newline);
  }
  return std::string(TrimQuotesAndNewlines(view));
}

}  // namespace sharing
}  // namespace packet
