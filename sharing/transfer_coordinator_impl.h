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

#ifndef PACKET_SHARING_TRANSFER_COORDINATOR_IMPL_H_
#define PACKET_SHARING_TRANSFER_COORDINATOR_IMPL_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/functional/any_invocable.h"
#include "absl/strings/string_view.h"
#include "internal/base/observer_list.h"
#include "internal/platform/clock.h"
#include "internal/platform/task_runner.h"
#include "sharing/broadcast_channel.h"
#include "sharing/desktop_notifier.h"
#include "sharing/discovery_registry.h"
#include "sharing/endpoint_info.h"
#include "sharing/event_router.h"
#include "sharing/inbound_session.h"
#include "sharing/inbound_slot.h"
#include "sharing/outbound_registry.h"
#include "sharing/outbound_session.h"
#include "sharing/proto/settings.pb.h"
#include "sharing/protocol_engine.h"
#include "sharing/protocol_event.h"
#include "sharing/task_supervisor.h"
#include "sharing/thread_timer.h"
#include "sharing/transfer_coordinator.h"
#include "sharing/worker_queue.h"

namespace packet {
namespace sharing {

// TransferCoordinator on top of a ProtocolEngine.
//
// Engine feeds are read by relay loops on `runtime_runner` and handed one
// message at a time to `service_runner`, where all session state visible to
// observers is changed. `service_runner` must run its tasks sequentially.
class TransferCoordinatorImpl : public TransferCoordinator,
                                private EventRouter::Delegate {
 public:
  TransferCoordinatorImpl(Clock* clock, TaskRunner* service_runner,
                          TaskRunner* runtime_runner, ProtocolEngine* engine,
                          DesktopNotifier* notifier,
                          proto::CoordinatorSettings settings);
  ~TransferCoordinatorImpl() override;

  // TransferCoordinator:
  void AddObserver(Observer* observer) override;
  void RemoveObserver(Observer* observer) override;
  bool HasObserver(Observer* observer) override;
  void Start(std::function<void(StatusCodes)> status_codes_callback) override;
  void Stop(std::function<void(StatusCodes)> status_codes_callback) override;
  void Restart(
      std::function<void(StatusCodes)> status_codes_callback) override;
  void Shutdown(
      std::function<void(StatusCodes)> status_codes_callback) override;
  void Send(absl::string_view endpoint_id, std::vector<std::string> files,
            std::function<void(StatusCodes)> status_codes_callback) override;
  void RespondToConsent(
      bool accept,
      std::function<void(StatusCodes)> status_codes_callback) override;
  void Cancel(absl::string_view transfer_id,
              std::function<void(StatusCodes)> status_codes_callback) override;
  void RefreshRecipients(
      std::function<void(StatusCodes)> status_codes_callback) override;
  void SetVisibility(
      bool visible,
      std::function<void(StatusCodes)> status_codes_callback) override;
  void SetDeviceName(
      absl::string_view device_name,
      std::function<void(StatusCodes)> status_codes_callback) override;
  void StartDiscovery(
      std::function<void(StatusCodes)> status_codes_callback) override;
  void StopDiscovery(
      std::function<void(StatusCodes)> status_codes_callback) override;
  void HandleNotificationAction(
      absl::string_view action_id, std::optional<std::string> target,
      std::function<void(StatusCodes)> status_codes_callback) override;
  bool IsTransferActive() const override;
  ServiceState GetServiceState() const override;
  std::vector<OutboundSession> GetOutboundSessions() const override;
  std::optional<InboundSession> GetInboundSession() const override;

  // Settings the engine was last started with, or will be started with.
  // Only valid on the service thread.
  const proto::CoordinatorSettings& settings() const { return settings_; }

  EventRouter& GetEventRouterForTesting() { return router_; }

 private:
  // EventRouter::Delegate:
  void OnInboundSessionOpened(const InboundSession& session) override;
  void OnInboundRequestRefused(const ProtocolEvent& event) override;
  void OnInboundSessionUpdated(const InboundSession& session,
                               const ProtocolEvent& event,
                               bool released) override;
  void OnOutboundSessionUpdated(const OutboundSession& session,
                                OutboundStateChange change) override;

  bool IsShuttingDown() const;
  bool IsRunning() const;

  // Runs `operation` on the service thread and reports its result. The
  // callback gets kServiceUnavailable if the coordinator shuts down first.
  void RunOperation(absl::string_view operation_name,
                    std::function<void(StatusCodes)> status_codes_callback,
                    absl::AnyInvocable<StatusCodes()> operation);
  void RunOnServiceThread(absl::string_view task_name,
                          absl::AnyInvocable<void()> task);

  StatusCodes StartInternal();
  StatusCodes StopInternal();
  StatusCodes ShutdownInternal();
  StatusCodes SendInternal(const std::string& endpoint_id,
                           const std::vector<std::string>& files);
  StatusCodes RespondToConsentInternal(bool accept);
  StatusCodes CancelInternal(const std::string& transfer_id);
  StatusCodes CancelInboundInternal();
  StatusCodes RefreshRecipientsInternal();
  StatusCodes SetVisibilityInternal(bool visible);
  StatusCodes SetDeviceNameInternal(const std::string& device_name);
  StatusCodes StartDiscoveryInternal();
  StatusCodes StopDiscoveryInternal();
  StatusCodes HandleNotificationActionInternal(
      const std::string& action_id, const std::optional<std::string>& target);

  // Records the user's answer, forwards it to the engine and updates the
  // notification.
  StatusCodes ApplyInboundUserAction(const std::string& transfer_id,
                                     UserAction action);
  void OnAutoDeclineTimeout(const std::string& transfer_id);

  // Creates the forwarding queues and the relay loops of a fresh engine run.
  void SpawnFeedRelays();
  template <typename T>
  void SpawnRelay(std::string name,
                  typename BroadcastChannel<T>::Receiver receiver,
                  std::shared_ptr<WorkerQueue<T>> queue, uint64_t generation);
  void OnFeedClosed(uint64_t generation);

  // Drops the inbound session and the outbound requests of a dead engine.
  void AbandonTransfers();

  void SetServiceState(ServiceState state);
  void NotifyInboundSessionChanged(const InboundSession& session);
  void NotifyOutboundSessionChanged(const OutboundSession& session,
                                    OutboundStateChange change);
  void OnEndpointDiscovered(const EndpointInfo& endpoint_info);
  void OnEndpointUpdated(const EndpointInfo& endpoint_info);

  TaskRunner& service_runner_;
  ProtocolEngine& engine_;
  DesktopNotifier& notifier_;

  // Shared with posted tasks, which check it before touching `this`.
  std::shared_ptr<std::atomic_bool> is_shutting_down_;
  std::atomic<ServiceState> service_state_ = ServiceState::kStopped;
  ObserverList<Observer> observers_;

  // Accessed on the service thread only.
  proto::CoordinatorSettings settings_;
  bool discovery_requested_ = false;
  // Bumped on every engine start and stop so that a late report from a relay
  // of an earlier run is ignored.
  uint64_t generation_ = 0;
  std::unique_ptr<ThreadTimer> auto_decline_timer_;

  OutboundRegistry outbound_registry_;
  InboundSlot inbound_slot_;
  DiscoveryRegistry discovery_registry_;
  EventRouter router_;
  TaskSupervisor supervisor_;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_TRANSFER_COORDINATOR_IMPL_H_
