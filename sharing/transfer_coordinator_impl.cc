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

#include "sharing/transfer_coordinator_impl.h"

#include <atomic>
#include <cstdint>
#include <filesystem>  // NOLINT(build/c++17)
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>  // NOLINT(build/c++11)
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/functional/any_invocable.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "internal/platform/clock.h"
#include "internal/platform/task_runner.h"
#include "sharing/broadcast_channel.h"
#include "sharing/constants.h"
#include "sharing/coordinator_settings.h"
#include "sharing/desktop_notifier.h"
#include "sharing/endpoint_info.h"
#include "sharing/event_relay.h"
#include "sharing/inbound_session.h"
#include "sharing/internal/public/logging.h"
#include "sharing/outbound_session.h"
#include "sharing/proto/settings.pb.h"
#include "sharing/protocol_engine.h"
#include "sharing/protocol_event.h"
#include "sharing/task_supervisor.h"
#include "sharing/thread_timer.h"
#include "sharing/transfer_notifications.h"
#include "sharing/worker_queue.h"

namespace packet {
namespace sharing {
namespace {

using StatusCodes = TransferCoordinator::StatusCodes;

void Complete(const std::function<void(StatusCodes)>& callback,
              StatusCodes status_code) {
  if (callback) {
    callback(status_code);
  }
}

// Maps registry errors to the codes reported to callers.
StatusCodes ToStatusCode(const absl::Status& status) {
  switch (status.code()) {
    case absl::StatusCode::kOk:
      return StatusCodes::kOk;
    case absl::StatusCode::kNotFound:
      return StatusCodes::kNotFound;
    case absl::StatusCode::kInvalidArgument:
    case absl::StatusCode::kFailedPrecondition:
      return StatusCodes::kInvalidArgument;
    default:
      return StatusCodes::kError;
  }
}

}  // namespace

TransferCoordinatorImpl::TransferCoordinatorImpl(
    Clock* clock, TaskRunner* service_runner, TaskRunner* runtime_runner,
    ProtocolEngine* engine, DesktopNotifier* notifier,
    proto::CoordinatorSettings settings)
    : service_runner_(*service_runner),
      engine_(*engine),
      notifier_(*notifier),
      is_shutting_down_(std::make_shared<std::atomic_bool>(false)),
      settings_(std::move(settings)),
      outbound_registry_(clock),
      discovery_registry_(
          &outbound_registry_,
          [this](const EndpointInfo& endpoint_info) {
            OnEndpointDiscovered(endpoint_info);
          },
          [this](const EndpointInfo& endpoint_info) {
            OnEndpointUpdated(endpoint_info);
          }),
      router_(clock, &outbound_registry_, &inbound_slot_, this),
      supervisor_(runtime_runner, service_runner) {}

TransferCoordinatorImpl::~TransferCoordinatorImpl() {
  is_shutting_down_->store(true);
  supervisor_.StopAll();
  auto_decline_timer_.reset();
}

void TransferCoordinatorImpl::AddObserver(Observer* observer) {
  observers_.AddObserver(observer);
}

void TransferCoordinatorImpl::RemoveObserver(Observer* observer) {
  observers_.RemoveObserver(observer);
}

bool TransferCoordinatorImpl::HasObserver(Observer* observer) {
  return observers_.HasObserver(observer);
}

void TransferCoordinatorImpl::Start(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_start", std::move(status_codes_callback),
               [this]() { return StartInternal(); });
}

void TransferCoordinatorImpl::Stop(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_stop", std::move(status_codes_callback),
               [this]() { return StopInternal(); });
}

void TransferCoordinatorImpl::Restart(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_restart", std::move(status_codes_callback), [this]() {
    StatusCodes status_code = StopInternal();
    if (status_code != StatusCodes::kOk) {
      LOG(WARNING) << __func__ << ": Stop failed with "
                   << StatusCodeToString(status_code) << ", starting anyway.";
    }
    return StartInternal();
  });
}

void TransferCoordinatorImpl::Shutdown(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_shutdown", std::move(status_codes_callback),
               [this]() { return ShutdownInternal(); });
}

void TransferCoordinatorImpl::Send(
    absl::string_view endpoint_id, std::vector<std::string> files,
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_send", std::move(status_codes_callback),
               [this, endpoint_id = std::string(endpoint_id),
                files = std::move(files)]() {
                 return SendInternal(endpoint_id, files);
               });
}

void TransferCoordinatorImpl::RespondToConsent(
    bool accept, std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_respond_to_consent", std::move(status_codes_callback),
               [this, accept]() { return RespondToConsentInternal(accept); });
}

void TransferCoordinatorImpl::Cancel(
    absl::string_view transfer_id,
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_cancel", std::move(status_codes_callback),
               [this, transfer_id = std::string(transfer_id)]() {
                 return CancelInternal(transfer_id);
               });
}

void TransferCoordinatorImpl::RefreshRecipients(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_refresh_recipients", std::move(status_codes_callback),
               [this]() { return RefreshRecipientsInternal(); });
}

void TransferCoordinatorImpl::SetVisibility(
    bool visible, std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_set_visibility", std::move(status_codes_callback),
               [this, visible]() { return SetVisibilityInternal(visible); });
}

void TransferCoordinatorImpl::SetDeviceName(
    absl::string_view device_name,
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_set_device_name", std::move(status_codes_callback),
               [this, device_name = std::string(device_name)]() {
                 return SetDeviceNameInternal(device_name);
               });
}

void TransferCoordinatorImpl::StartDiscovery(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_start_discovery", std::move(status_codes_callback),
               [this]() { return StartDiscoveryInternal(); });
}

void TransferCoordinatorImpl::StopDiscovery(
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_stop_discovery", std::move(status_codes_callback),
               [this]() { return StopDiscoveryInternal(); });
}

void TransferCoordinatorImpl::HandleNotificationAction(
    absl::string_view action_id, std::optional<std::string> target,
    std::function<void(StatusCodes)> status_codes_callback) {
  RunOperation("api_handle_notification_action",
               std::move(status_codes_callback),
               [this, action_id = std::string(action_id),
                target = std::move(target)]() {
                 return HandleNotificationActionInternal(action_id, target);
               });
}

bool TransferCoordinatorImpl::IsTransferActive() const {
  return outbound_registry_.HasActiveTransfer() || inbound_slot_.IsOccupied();
}

TransferCoordinator::ServiceState TransferCoordinatorImpl::GetServiceState()
    const {
  return service_state_.load();
}

std::vector<OutboundSession> TransferCoordinatorImpl::GetOutboundSessions()
    const {
  return outbound_registry_.List();
}

std::optional<InboundSession> TransferCoordinatorImpl::GetInboundSession()
    const {
  return inbound_slot_.Get();
}

bool TransferCoordinatorImpl::IsShuttingDown() const {
  return is_shutting_down_->load();
}

bool TransferCoordinatorImpl::IsRunning() const {
  return service_state_.load() == ServiceState::kRunning;
}

void TransferCoordinatorImpl::RunOperation(
    absl::string_view operation_name,
    std::function<void(StatusCodes)> status_codes_callback,
    absl::AnyInvocable<StatusCodes()> operation) {
  if (IsShuttingDown()) {
    LOG(WARNING) << __func__ << ": Skip the operation " << operation_name
                 << " due to coordinator is shutting down.";
    Complete(status_codes_callback, StatusCodes::kServiceUnavailable);
    return;
  }

  VLOG(1) << __func__ << ": Scheduled to run operation " << operation_name
          << " on service thread.";
  bool posted = service_runner_.PostTask(
      [is_shutting_down = std::weak_ptr<std::atomic_bool>(is_shutting_down_),
       operation_name = std::string(operation_name), status_codes_callback,
       operation = std::move(operation)]() mutable {
        std::shared_ptr<std::atomic_bool> is_shutting =
            is_shutting_down.lock();
        if (is_shutting == nullptr || is_shutting->load()) {
          LOG(WARNING) << __func__ << ": Give up the operation "
                       << operation_name
                       << " due to coordinator is shutting down.";
          Complete(status_codes_callback, StatusCodes::kServiceUnavailable);
          return;
        }

        VLOG(1) << __func__ << ": Started to run operation "
                << operation_name;
        StatusCodes status_code = operation();
        LOG(INFO) << operation_name << ": "
                  << StatusCodeToString(status_code);
        Complete(status_codes_callback, status_code);
      });
  if (!posted) {
    LOG(WARNING) << __func__ << ": Service thread is gone, "
                 << operation_name << " not run.";
    Complete(status_codes_callback, StatusCodes::kServiceUnavailable);
  }
}

void TransferCoordinatorImpl::RunOnServiceThread(
    absl::string_view task_name, absl::AnyInvocable<void()> task) {
  if (IsShuttingDown()) {
    LOG(WARNING) << __func__ << ": Skip the task " << task_name
                 << " due to coordinator is shutting down.";
    return;
  }

  bool posted = service_runner_.PostTask(
      [is_shutting_down = std::weak_ptr<std::atomic_bool>(is_shutting_down_),
       task_name = std::string(task_name), task = std::move(task)]() mutable {
        std::shared_ptr<std::atomic_bool> is_shutting =
            is_shutting_down.lock();
        if (is_shutting == nullptr || is_shutting->load()) {
          LOG(WARNING) << __func__ << ": Give up the task " << task_name
                       << " due to coordinator is shutting down.";
          return;
        }
        VLOG(1) << __func__ << ": Started to run task " << task_name;
        task();
      });
  if (!posted) {
    LOG(WARNING) << __func__ << ": Service thread is gone, " << task_name
                 << " not run.";
  }
}

StatusCodes TransferCoordinatorImpl::StartInternal() {
  if (IsRunning()) {
    LOG(INFO) << __func__ << ": Engine is already running.";
    return StatusCodes::kOk;
  }
  absl::Status status = ValidateSettings(settings_);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Invalid settings: " << status;
    SetServiceState(ServiceState::kUnavailable);
    return StatusCodes::kInvalidArgument;
  }

  SetServiceState(ServiceState::kStarting);
  status = engine_.Start(settings_);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to start engine: " << status;
    SetServiceState(ServiceState::kUnavailable);
    return StatusCodes::kServiceUnavailable;
  }

  ++generation_;
  SpawnFeedRelays();
  SetServiceState(ServiceState::kRunning);

  if (discovery_requested_) {
    status = engine_.StartDiscovery();
    if (!status.ok()) {
      LOG(WARNING) << __func__ << ": Failed to resume discovery: " << status;
    }
  }
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::StopInternal() {
  size_t cancelled = supervisor_.StopAll();
  VLOG(1) << __func__ << ": Cancelled " << cancelled << " tasks.";
  auto_decline_timer_.reset();
  ++generation_;
  AbandonTransfers();

  if (service_state_.load() == ServiceState::kStopped) {
    return StatusCodes::kOk;
  }
  absl::Status status = engine_.Stop(kEngineStopTimeout);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to stop engine: " << status;
    SetServiceState(ServiceState::kUnavailable);
    return StatusCodes::kServiceUnavailable;
  }
  SetServiceState(ServiceState::kStopped);
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::ShutdownInternal() {
  is_shutting_down_->store(true);

  std::optional<InboundSession> session = inbound_slot_.Release();
  if (session.has_value() && !IsTerminalState(session->last_event().state)) {
    // Notifications outlive the application.
    notifier_.Withdraw(session->notification_id());
  }
  auto_decline_timer_.reset();
  supervisor_.StopAll();

  if (service_state_.load() != ServiceState::kStopped) {
    absl::Status status = engine_.Stop(kEngineStopTimeout);
    if (!status.ok()) {
      LOG(ERROR) << __func__ << ": Failed to stop engine: " << status;
    }
  }
  SetServiceState(ServiceState::kStopped);
  observers_.Clear();
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::SendInternal(
    const std::string& endpoint_id, const std::vector<std::string>& files) {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  if (files.empty()) {
    LOG(WARNING) << __func__ << ": Nothing to send to " << endpoint_id;
    return StatusCodes::kInvalidArgument;
  }
  std::optional<EndpointInfo> endpoint_info =
      discovery_registry_.Get(endpoint_id);
  if (!endpoint_info.has_value()) {
    LOG(WARNING) << __func__ << ": Unknown endpoint " << endpoint_id;
    return StatusCodes::kNotFound;
  }
  std::optional<std::string> address = endpoint_info->SocketAddress();
  if (!address.has_value()) {
    LOG(WARNING) << __func__ << ": Endpoint " << endpoint_id
                 << " has no address yet.";
    return StatusCodes::kInvalidArgument;
  }

  int64_t total_size = 0;
  for (const std::string& file : files) {
    std::error_code error;
    uintmax_t size = std::filesystem::file_size(file, error);
    if (error) {
      LOG(WARNING) << __func__ << ": Cannot read " << file << ": "
                   << error.message();
      return StatusCodes::kInvalidArgument;
    }
    total_size += static_cast<int64_t>(size);
  }

  std::optional<OutboundSession> previous = outbound_registry_.Get(endpoint_id);
  absl::StatusOr<OutboundSession> session =
      outbound_registry_.PrepareSend(endpoint_id, files, total_size);
  if (!session.ok()) {
    LOG(WARNING) << __func__ << ": " << session.status();
    if (absl::IsFailedPrecondition(session.status())) {
      return StatusCodes::kTransferAlreadyInProgress;
    }
    return ToStatusCode(session.status());
  }
  if (previous.has_value() && previous->state() != session->state()) {
    NotifyOutboundSessionChanged(
        *session, OutboundStateChange{previous->state(), session->state()});
  }

  absl::Status status = engine_.Send(SendRequest{
      endpoint_info->id, endpoint_info->DisplayName(), *address, files});
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Engine refused send to " << endpoint_id
               << ": " << status;
    absl::StatusOr<OutboundStateChange> change =
        outbound_registry_.MarkFailed(endpoint_id);
    std::optional<OutboundSession> failed = outbound_registry_.Get(endpoint_id);
    if (change.ok() && failed.has_value()) {
      NotifyOutboundSessionChanged(*failed, *change);
    }
    return StatusCodes::kError;
  }
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::RespondToConsentInternal(bool accept) {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  std::optional<InboundSession> session = inbound_slot_.Get();
  if (!session.has_value()) {
    LOG(WARNING) << __func__ << ": No pending consent request.";
    return StatusCodes::kNotFound;
  }
  return ApplyInboundUserAction(session->transfer_id(),
                                accept ? UserAction::kConsentAccept
                                       : UserAction::kConsentDecline);
}

StatusCodes TransferCoordinatorImpl::CancelInternal(
    const std::string& transfer_id) {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  std::optional<InboundSession> inbound = inbound_slot_.Get();
  if (inbound.has_value() && inbound->transfer_id() == transfer_id) {
    return ApplyInboundUserAction(transfer_id, UserAction::kTransferCancel);
  }

  std::optional<OutboundSession> outbound = outbound_registry_.Get(transfer_id);
  if (!outbound.has_value()) {
    LOG(WARNING) << __func__ << ": Unknown transfer " << transfer_id;
    return StatusCodes::kNotFound;
  }
  if (!IsActiveOutboundState(outbound->state()) &&
      outbound->state() != OutboundTransferState::kQueued) {
    LOG(WARNING) << __func__ << ": Nothing to cancel for "
                 << outbound->ToString();
    return StatusCodes::kInvalidArgument;
  }
  // The session moves on once the engine reports the cancellation.
  absl::Status status =
      engine_.SendAction(transfer_id, TransferAction::kTransferCancel);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to cancel " << transfer_id << ": "
               << status;
    return StatusCodes::kError;
  }
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::CancelInboundInternal() {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  std::optional<InboundSession> session = inbound_slot_.Get();
  if (!session.has_value()) {
    return StatusCodes::kNotFound;
  }
  return ApplyInboundUserAction(session->transfer_id(),
                                UserAction::kTransferCancel);
}

StatusCodes TransferCoordinatorImpl::RefreshRecipientsInternal() {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  std::vector<std::string> removed = outbound_registry_.RemoveIdle();
  discovery_registry_.Forget(removed);
  if (!removed.empty()) {
    observers_.Notify([&](Observer* observer) {
      observer->OnOutboundSessionsRemoved(removed);
    });
  }

  discovery_requested_ = true;
  absl::Status status = engine_.StopDiscovery();
  if (!status.ok()) {
    LOG(WARNING) << __func__ << ": Failed to stop discovery: " << status;
  }
  status = engine_.StartDiscovery();
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to start discovery: " << status;
    return StatusCodes::kError;
  }
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::SetVisibilityInternal(bool visible) {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  proto::DeviceVisibility visibility = ToDeviceVisibility(visible);
  absl::Status status = engine_.ChangeVisibility(visibility);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to change visibility: " << status;
    return StatusCodes::kError;
  }
  settings_.set_visibility(visibility);
  LOG(INFO) << __func__ << ": Visibility is now "
            << DeviceVisibilityToString(visibility);
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::SetDeviceNameInternal(
    const std::string& device_name) {
  if (device_name.empty()) {
    return StatusCodes::kInvalidArgument;
  }
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  if (IsTransferActive()) {
    LOG(WARNING) << __func__ << ": Cannot rename during a transfer.";
    return StatusCodes::kTransferAlreadyInProgress;
  }

  settings_.set_device_name(device_name);
  // The name is part of the advertisement, which is only built on start.
  StatusCodes status_code = StopInternal();
  if (status_code != StatusCodes::kOk) {
    return status_code;
  }
  return StartInternal();
}

StatusCodes TransferCoordinatorImpl::StartDiscoveryInternal() {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  absl::Status status = engine_.StartDiscovery();
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to start discovery: " << status;
    return StatusCodes::kError;
  }
  discovery_requested_ = true;
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::StopDiscoveryInternal() {
  if (!IsRunning()) {
    return StatusCodes::kServiceUnavailable;
  }
  discovery_requested_ = false;
  absl::Status status = engine_.StopDiscovery();
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to stop discovery: " << status;
    return StatusCodes::kError;
  }
  return StatusCodes::kOk;
}

StatusCodes TransferCoordinatorImpl::HandleNotificationActionInternal(
    const std::string& action_id, const std::optional<std::string>& target) {
  LOG(INFO) << __func__ << ": Notification action " << action_id;
  if (action_id == kConsentAcceptAction) {
    return RespondToConsentInternal(/*accept=*/true);
  }
  if (action_id == kConsentDeclineAction) {
    return RespondToConsentInternal(/*accept=*/false);
  }
  if (action_id == kTransferCancelAction) {
    return CancelInboundInternal();
  }
  if (action_id == kOpenFolderAction) {
    notifier_.OpenFolder(target.value_or(settings_.download_folder()));
    return StatusCodes::kOk;
  }
  if (action_id == kCopyTextAction) {
    if (!target.has_value()) {
      return StatusCodes::kInvalidArgument;
    }
    notifier_.CopyToClipboard(*target);
    return StatusCodes::kOk;
  }
  LOG(WARNING) << __func__ << ": Unknown action " << action_id;
  return StatusCodes::kInvalidArgument;
}

StatusCodes TransferCoordinatorImpl::ApplyInboundUserAction(
    const std::string& transfer_id, UserAction action) {
  absl::StatusOr<InboundSession> session =
      inbound_slot_.SetUserAction(transfer_id, action);
  if (!session.ok()) {
    LOG(WARNING) << __func__ << ": " << session.status();
    return ToStatusCode(session.status());
  }
  if (action != UserAction::kTransferCancel) {
    auto_decline_timer_.reset();
  }

  absl::Status status =
      engine_.SendAction(transfer_id, ToTransferAction(action));
  switch (action) {
    case UserAction::kConsentAccept:
      notifier_.Show(session->notification_id(),
                     ReceivingNotification(session->last_event()));
      break;
    case UserAction::kConsentDecline:
    case UserAction::kTransferCancel:
      notifier_.Withdraw(session->notification_id());
      break;
  }
  NotifyInboundSessionChanged(*session);

  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to send "
               << UserActionToString(action) << " for " << transfer_id
               << ": " << status;
    return StatusCodes::kError;
  }
  return StatusCodes::kOk;
}

void TransferCoordinatorImpl::OnAutoDeclineTimeout(
    const std::string& transfer_id) {
  absl::StatusOr<InboundSession> session =
      inbound_slot_.DeclineIfUnanswered(transfer_id);
  if (!session.ok()) {
    VLOG(1) << __func__ << ": " << session.status();
    return;
  }
  LOG(INFO) << __func__ << ": No answer for " << transfer_id << " after "
            << kAutoDeclineTimeout << ", declining.";
  absl::Status status =
      engine_.SendAction(transfer_id, TransferAction::kConsentDecline);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to decline " << transfer_id << ": "
               << status;
  }
  notifier_.Withdraw(session->notification_id());
  notifier_.ShowToast(kRequestTimedOutMessage);
  NotifyInboundSessionChanged(*session);
}

template <typename T>
void TransferCoordinatorImpl::SpawnRelay(
    std::string name, typename BroadcastChannel<T>::Receiver receiver,
    std::shared_ptr<WorkerQueue<T>> queue, uint64_t generation) {
  supervisor_.Spawn(
      Scheduler::kRuntime, std::move(name),
      [this, is_shutting_down = std::weak_ptr<std::atomic_bool>(
                 is_shutting_down_),
       receiver = std::move(receiver), queue = std::move(queue),
       generation](const TaskHandle& handle) mutable {
        if (RelayUntilCancelled<T>(handle, receiver, *queue) !=
            RelayResult::kFeedClosed) {
          return;
        }
        std::shared_ptr<std::atomic_bool> is_shutting =
            is_shutting_down.lock();
        if (is_shutting == nullptr || is_shutting->load()) {
          return;
        }
        RunOnServiceThread(handle.name(),
                           [this, generation]() { OnFeedClosed(generation); });
      });
}

void TransferCoordinatorImpl::SpawnFeedRelays() {
  std::weak_ptr<std::atomic_bool> is_shutting_down = is_shutting_down_;

  auto message_queue = std::make_shared<WorkerQueue<EngineMessage>>(
      &service_runner_, kForwardingQueueCapacity);
  if (!message_queue->Start(
          [this, is_shutting_down](EngineMessage message) {
            std::shared_ptr<std::atomic_bool> is_shutting =
                is_shutting_down.lock();
            if (is_shutting == nullptr || is_shutting->load()) {
              return;
            }
            router_.Route(message);
          })) {
    LOG(ERROR) << __func__ << ": Failed to start the event queue.";
  }
  supervisor_.Track(std::make_shared<TaskHandle>(
      "event_forwarder", Scheduler::kUi,
      [message_queue]() { message_queue->Stop(); }));

  auto endpoint_queue = std::make_shared<WorkerQueue<EndpointInfo>>(
      &service_runner_, kForwardingQueueCapacity);
  if (!endpoint_queue->Start(
          [this, is_shutting_down](EndpointInfo endpoint_info) {
            std::shared_ptr<std::atomic_bool> is_shutting =
                is_shutting_down.lock();
            if (is_shutting == nullptr || is_shutting->load()) {
              return;
            }
            discovery_registry_.OnEndpointDiscovered(endpoint_info);
          })) {
    LOG(ERROR) << __func__ << ": Failed to start the discovery queue.";
  }
  supervisor_.Track(std::make_shared<TaskHandle>(
      "discovery_forwarder", Scheduler::kUi,
      [endpoint_queue]() { endpoint_queue->Stop(); }));

  // Subscribe here, before the loops run, so nothing published after start
  // is missed.
  SpawnRelay<EngineMessage>("event_relay", engine_.messages().Subscribe(),
                            message_queue, generation_);
  SpawnRelay<EndpointInfo>("discovery_relay", engine_.discovery().Subscribe(),
                           endpoint_queue, generation_);
}

void TransferCoordinatorImpl::OnFeedClosed(uint64_t generation) {
  if (generation != generation_) {
    VLOG(1) << __func__ << ": Ignoring report from an earlier engine run.";
    return;
  }
  LOG(ERROR) << __func__ << ": Engine feed closed, restart required.";
  supervisor_.StopAll();
  auto_decline_timer_.reset();
  ++generation_;
  SetServiceState(ServiceState::kUnavailable);
}

void TransferCoordinatorImpl::AbandonTransfers() {
  std::optional<InboundSession> session = inbound_slot_.Release();
  if (session.has_value()) {
    LOG(INFO) << __func__ << ": Dropping " << session->ToString();
    if (!IsTerminalState(session->last_event().state)) {
      notifier_.Withdraw(session->notification_id());
    }
  }

  absl::flat_hash_map<std::string, OutboundTransferState> previous_states;
  for (const OutboundSession& session : outbound_registry_.List()) {
    previous_states.emplace(session.id(), session.state());
  }
  for (const std::string& id : outbound_registry_.MarkUnfinishedFailed()) {
    std::optional<OutboundSession> failed = outbound_registry_.Get(id);
    auto it = previous_states.find(id);
    if (!failed.has_value() || it == previous_states.end()) {
      continue;
    }
    LOG(INFO) << __func__ << ": Failed " << failed->ToString();
    NotifyOutboundSessionChanged(
        *failed, OutboundStateChange{it->second, failed->state()});
  }
}

void TransferCoordinatorImpl::SetServiceState(ServiceState state) {
  ServiceState previous = service_state_.exchange(state);
  if (previous == state) {
    return;
  }
  LOG(INFO) << __func__ << ": " << ServiceStateToString(previous) << " -> "
            << ServiceStateToString(state);
  observers_.Notify([&](Observer* observer) {
    observer->OnServiceStateChanged(state);
  });
}

void TransferCoordinatorImpl::NotifyInboundSessionChanged(
    const InboundSession& session) {
  observers_.Notify([&](Observer* observer) {
    observer->OnInboundSessionChanged(session);
  });
}

void TransferCoordinatorImpl::NotifyOutboundSessionChanged(
    const OutboundSession& session, OutboundStateChange change) {
  observers_.Notify([&](Observer* observer) {
    observer->OnOutboundSessionChanged(session, change);
  });
}

void TransferCoordinatorImpl::OnEndpointDiscovered(
    const EndpointInfo& endpoint_info) {
  observers_.Notify([&](Observer* observer) {
    observer->OnEndpointDiscovered(endpoint_info);
  });
}

void TransferCoordinatorImpl::OnEndpointUpdated(
    const EndpointInfo& endpoint_info) {
  observers_.Notify([&](Observer* observer) {
    observer->OnEndpointUpdated(endpoint_info);
  });
}

void TransferCoordinatorImpl::OnInboundSessionOpened(
    const InboundSession& session) {
  notifier_.Show(session.notification_id(),
                 IncomingRequestNotification(session.last_event()));
  auto_decline_timer_ = std::make_unique<ThreadTimer>(
      service_runner_, "auto_decline", kAutoDeclineTimeout,
      [this,
       is_shutting_down = std::weak_ptr<std::atomic_bool>(is_shutting_down_),
       transfer_id = session.transfer_id()]() {
        std::shared_ptr<std::atomic_bool> is_shutting =
            is_shutting_down.lock();
        if (is_shutting == nullptr || is_shutting->load()) {
          return;
        }
        OnAutoDeclineTimeout(transfer_id);
      });
  NotifyInboundSessionChanged(session);
}

void TransferCoordinatorImpl::OnInboundRequestRefused(
    const ProtocolEvent& event) {
  LOG(WARNING) << __func__ << ": Declining " << event.id
               << ", another transfer is in progress.";
  absl::Status status =
      engine_.SendAction(event.id, TransferAction::kConsentDecline);
  if (!status.ok()) {
    LOG(ERROR) << __func__ << ": Failed to decline " << event.id << ": "
               << status;
  }
}

void TransferCoordinatorImpl::OnInboundSessionUpdated(
    const InboundSession& session, const ProtocolEvent& event,
    bool released) {
  const std::string& notification_id = session.notification_id();
  const ProtocolEvent& last_event = session.last_event();
  switch (event.state) {
    case ProtocolState::kDisconnected:
      notifier_.Show(notification_id,
                     NoticeNotification(last_event,
                                        kUnexpectedDisconnectionMessage));
      notifier_.ShowToast(kUnexpectedDisconnectionMessage);
      break;
    case ProtocolState::kRejected:
      notifier_.Withdraw(notification_id);
      break;
    case ProtocolState::kCancelled:
      // The user's own cancel already withdrew the notification.
      if (!session.user_cancelled()) {
        notifier_.Show(notification_id,
                       NoticeNotification(last_event,
                                          kCancelledBySenderMessage));
        notifier_.ShowToast(kCancelledBySenderMessage);
      }
      break;
    case ProtocolState::kFinished: {
      notifier_.Show(notification_id,
                     ReceivedNotification(last_event,
                                          settings_.download_folder()));
      if (const std::vector<std::string>* files = last_event.Files()) {
        notifier_.ShowToast(FilesReceivedMessage(files->size()));
      }
      break;
    }
    default:
      break;
  }
  if (released) {
    auto_decline_timer_.reset();
  }
  NotifyInboundSessionChanged(session);
}

void TransferCoordinatorImpl::OnOutboundSessionUpdated(
    const OutboundSession& session, OutboundStateChange change) {
  NotifyOutboundSessionChanged(session, change);
}

}  // namespace sharing
}  // namespace packet
