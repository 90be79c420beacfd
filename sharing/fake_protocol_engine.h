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

#ifndef PACKET_SHARING_FAKE_PROTOCOL_ENGINE_H_
#define PACKET_SHARING_FAKE_PROTOCOL_ENGINE_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/synchronization/mutex.h"
#include "absl/time/time.h"
#include "sharing/broadcast_channel.h"
#include "sharing/endpoint_info.h"
#include "sharing/proto/settings.pb.h"
#include "sharing/protocol_engine.h"
#include "sharing/protocol_event.h"

namespace packet {
namespace sharing {

// Fake ProtocolEngine for testing. Records every call and lets tests publish
// on the feeds of the current run.
class FakeProtocolEngine : public ProtocolEngine {
 public:
  FakeProtocolEngine();
  ~FakeProtocolEngine() override;

  // ProtocolEngine:
  absl::Status Start(const proto::CoordinatorSettings& settings) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status Stop(absl::Duration timeout) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  BroadcastChannel<EngineMessage> messages() override
      ABSL_LOCKS_EXCLUDED(mutex_);
  BroadcastChannel<EndpointInfo> discovery() override
      ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status StartDiscovery() override ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status StopDiscovery() override ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status Send(const SendRequest& request) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status SendAction(absl::string_view id, TransferAction action) override
      ABSL_LOCKS_EXCLUDED(mutex_);
  absl::Status ChangeVisibility(proto::DeviceVisibility visibility) override
      ABSL_LOCKS_EXCLUDED(mutex_);

  // Testing methods
  bool EmitMessage(EngineMessage message) ABSL_LOCKS_EXCLUDED(mutex_);
  bool EmitEndpoint(EndpointInfo endpoint_info) ABSL_LOCKS_EXCLUDED(mutex_);

  // Closes the message feed without stopping the engine.
  void CloseMessages() ABSL_LOCKS_EXCLUDED(mutex_);

  void set_start_status(absl::Status status) ABSL_LOCKS_EXCLUDED(mutex_);
  void set_stop_status(absl::Status status) ABSL_LOCKS_EXCLUDED(mutex_);
  void set_send_status(absl::Status status) ABSL_LOCKS_EXCLUDED(mutex_);

  bool is_running() const ABSL_LOCKS_EXCLUDED(mutex_);
  bool is_discovering() const ABSL_LOCKS_EXCLUDED(mutex_);
  int start_count() const ABSL_LOCKS_EXCLUDED(mutex_);
  int stop_count() const ABSL_LOCKS_EXCLUDED(mutex_);
  int start_discovery_count() const ABSL_LOCKS_EXCLUDED(mutex_);
  std::optional<proto::CoordinatorSettings> settings() const
      ABSL_LOCKS_EXCLUDED(mutex_);
  std::vector<SendRequest> send_requests() const ABSL_LOCKS_EXCLUDED(mutex_);
  std::vector<std::pair<std::string, TransferAction>> actions() const
      ABSL_LOCKS_EXCLUDED(mutex_);
  std::vector<proto::DeviceVisibility> visibility_changes() const
      ABSL_LOCKS_EXCLUDED(mutex_);

 private:
  absl::Status CheckRunning() const ABSL_EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  BroadcastChannel<EngineMessage> messages_ ABSL_GUARDED_BY(mutex_);
  BroadcastChannel<EndpointInfo> discovery_ ABSL_GUARDED_BY(mutex_);
  bool running_ ABSL_GUARDED_BY(mutex_) = false;
  bool discovering_ ABSL_GUARDED_BY(mutex_) = false;
  int start_count_ ABSL_GUARDED_BY(mutex_) = 0;
  int stop_count_ ABSL_GUARDED_BY(mutex_) = 0;
  int start_discovery_count_ ABSL_GUARDED_BY(mutex_) = 0;
  absl::Status start_status_ ABSL_GUARDED_BY(mutex_);
  absl::Status stop_status_ ABSL_GUARDED_BY(mutex_);
  absl::Status send_status_ ABSL_GUARDED_BY(mutex_);
  std::optional<proto::CoordinatorSettings> settings_ ABSL_GUARDED_BY(mutex_);
  std::vector<SendRequest> send_requests_ ABSL_GUARDED_BY(mutex_);
  std::vector<std::pair<std::string, TransferAction>> actions_
      ABSL_GUARDED_BY(mutex_);
  std::vector<proto::DeviceVisibility> visibility_changes_
      ABSL_GUARDED_BY(mutex_);
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_FAKE_PROTOCOL_ENGINE_H_
