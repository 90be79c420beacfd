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

#include "sharing/fake_protocol_engine.h"

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "sharing/broadcast_channel.h"
#include "sharing/constants.h"
#include "sharing/endpoint_info.h"
#include "sharing/proto/settings.pb.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

FakeProtocolEngine::FakeProtocolEngine()
    : messages_(kBroadcastChannelCapacity),
      discovery_(kBroadcastChannelCapacity) {}

FakeProtocolEngine::~FakeProtocolEngine() {
  absl::MutexLock lock(&mutex_);
  messages_.Close();
  discovery_.Close();
}

absl::Status FakeProtocolEngine::Start(
    const proto::CoordinatorSettings& settings) {
  absl::MutexLock lock(&mutex_);
  ++start_count_;
  if (!start_status_.ok()) {
    return start_status_;
  }
  if (running_) {
    return absl::FailedPreconditionError("Engine is already running");
  }
  running_ = true;
  settings_ = settings;
  messages_ = BroadcastChannel<EngineMessage>(kBroadcastChannelCapacity);
  discovery_ = BroadcastChannel<EndpointInfo>(kBroadcastChannelCapacity);
  return absl::OkStatus();
}

absl::Status FakeProtocolEngine::Stop(absl::Duration timeout) {
  absl::MutexLock lock(&mutex_);
  ++stop_count_;
  if (!stop_status_.ok()) {
    return stop_status_;
  }
  running_ = false;
  discovering_ = false;
  messages_.Close();
  discovery_.Close();
  return absl::OkStatus();
}

BroadcastChannel<EngineMessage> FakeProtocolEngine::messages() {
  absl::MutexLock lock(&mutex_);
  return messages_;
}

BroadcastChannel<EndpointInfo> FakeProtocolEngine::discovery() {
  absl::MutexLock lock(&mutex_);
  return discovery_;
}

absl::Status FakeProtocolEngine::StartDiscovery() {
  absl::MutexLock lock(&mutex_);
  absl::Status status = CheckRunning();
  if (!status.ok()) {
    return status;
  }
  discovering_ = true;
  ++start_discovery_count_;
  return absl::OkStatus();
}

absl::Status FakeProtocolEngine::StopDiscovery() {
  absl::MutexLock lock(&mutex_);
  absl::Status status = CheckRunning();
  if (!status.ok()) {
    return status;
  }
  discovering_ = false;
  return absl::OkStatus();
}

absl::Status FakeProtocolEngine::Send(const SendRequest& request) {
  absl::MutexLock lock(&mutex_);
  absl::Status status = CheckRunning();
  if (!status.ok()) {
    return status;
  }
  if (!send_status_.ok()) {
    return send_status_;
  }
  send_requests_.push_back(request);
  return absl::OkStatus();
}

absl::Status FakeProtocolEngine::SendAction(absl::string_view id,
                                            TransferAction action) {
  absl::MutexLock lock(&mutex_);
  absl::Status status = CheckRunning();
  if (!status.ok()) {
    return status;
  }
  actions_.emplace_back(std::string(id), action);
  // Actions travel on the shared message feed, so subscribers see them too.
  messages_.Send(InternalMessage{std::string(id), action});
  return absl::OkStatus();
}

absl::Status FakeProtocolEngine::ChangeVisibility(
    proto::DeviceVisibility visibility) {
  absl::MutexLock lock(&mutex_);
  absl::Status status = CheckRunning();
  if (!status.ok()) {
    return status;
  }
  visibility_changes_.push_back(visibility);
  return absl::OkStatus();
}

bool FakeProtocolEngine::EmitMessage(EngineMessage message) {
  absl::MutexLock lock(&mutex_);
  return messages_.Send(std::move(message));
}

bool FakeProtocolEngine::EmitEndpoint(EndpointInfo endpoint_info) {
  absl::MutexLock lock(&mutex_);
  return discovery_.Send(std::move(endpoint_info));
}

void FakeProtocolEngine::CloseMessages() {
  absl::MutexLock lock(&mutex_);
  messages_.Close();
}

void FakeProtocolEngine::set_start_status(absl::Status status) {
  absl::MutexLock lock(&mutex_);
  start_status_ = std::move(status);
}

void FakeProtocolEngine::set_stop_status(absl::Status status) {
  absl::MutexLock lock(&mutex_);
  stop_status_ = std::move(status);
}

void FakeProtocolEngine::set_send_status(absl::Status status) {
  absl::MutexLock lock(&mutex_);
  send_status_ = std::move(status);
}

bool FakeProtocolEngine::is_running() const {
  absl::MutexLock lock(&mutex_);
  return running_;
}

bool FakeProtocolEngine::is_discovering() const {
  absl::MutexLock lock(&mutex_);
  return discovering_;
}

int FakeProtocolEngine::start_count() const {
  absl::MutexLock lock(&mutex_);
  return start_count_;
}

int FakeProtocolEngine::stop_count() const {
  absl::MutexLock lock(&mutex_);
  return stop_count_;
}

int FakeProtocolEngine::start_discovery_count() const {
  absl::MutexLock lock(&mutex_);
  return start_discovery_count_;
}

std::optional<proto::CoordinatorSettings> FakeProtocolEngine::settings()
    const {
  absl::MutexLock lock(&mutex_);
  return settings_;
}

std::vector<SendRequest> FakeProtocolEngine::send_requests() const {
  absl::MutexLock lock(&mutex_);
  return send_requests_;
}

std::vector<std::pair<std::string, TransferAction>>
FakeProtocolEngine::actions() const {
  absl::MutexLock lock(&mutex_);
  return actions_;
}

std::vector<proto::DeviceVisibility> FakeProtocolEngine::visibility_changes()
    const {
  absl::MutexLock lock(&mutex_);
  return visibility_changes_;
}

absl::Status FakeProtocolEngine::CheckRunning() const {
  if (!running_) {
    return absl::FailedPreconditionError("Engine is not running");
  }
  return absl::OkStatus();
}

}  // namespace sharing
}  // namespace packet
