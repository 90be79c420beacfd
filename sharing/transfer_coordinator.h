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

#ifndef PACKET_SHARING_TRANSFER_COORDINATOR_H_
#define PACKET_SHARING_TRANSFER_COORDINATOR_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"
#include "sharing/endpoint_info.h"
#include "sharing/inbound_session.h"
#include "sharing/outbound_session.h"

namespace packet {
namespace sharing {

// Tracks every send and receive attempt of the desktop client, mediates user
// consent and keeps the protocol engine running.
//
// Operations are asynchronous. They run in order on the coordinator's
// service thread and report their result through `status_codes_callback`.
// Observers are called on the service thread.
class TransferCoordinator {
 public:
  enum class StatusCodes {
    // The operation was successful.
    kOk = 0,
    // The operation failed, without any more information.
    kError = 1,
    // Method argument is invalid, or the request does not fit the transfer
    // state.
    kInvalidArgument = 2,
    // The engine is stopped, restarting or failed to start. Retry after a
    // restart.
    kServiceUnavailable = 3,
    // The operation is not allowed while a transfer is running.
    kTransferAlreadyInProgress = 4,
    // No session or endpoint has the given id.
    kNotFound = 5,
    kMaxValue = kNotFound
  };

  enum class ServiceState {
    kStopped,
    kStarting,
    kRunning,
    // Start, stop or a feed failed. Only a restart leaves this state.
    kUnavailable,
  };

  class Observer {
   public:
    virtual ~Observer() = default;

    virtual void OnServiceStateChanged(ServiceState state) {}

    // A new endpoint was discovered and has an outbound session.
    virtual void OnEndpointDiscovered(const EndpointInfo& endpoint_info) {}
    // A known endpoint was reported again, e.g. with a new presence flag.
    virtual void OnEndpointUpdated(const EndpointInfo& endpoint_info) {}

    virtual void OnOutboundSessionChanged(const OutboundSession& session,
                                          OutboundStateChange change) {}
    // Sessions dropped by a recipient refresh.
    virtual void OnOutboundSessionsRemoved(
        const std::vector<std::string>& ids) {}

    // Called for every change of the inbound session, including the one
    // that releases it.
    virtual void OnInboundSessionChanged(const InboundSession& session) {}
  };

  static std::string StatusCodeToString(StatusCodes status_code);
  static std::string ServiceStateToString(ServiceState state);

  virtual ~TransferCoordinator() = default;

  virtual void AddObserver(Observer* observer) = 0;
  virtual void RemoveObserver(Observer* observer) = 0;
  virtual bool HasObserver(Observer* observer) = 0;

  // Starts the engine with the current settings and subscribes to its feeds.
  virtual void Start(
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Cancels every supervised loop and stops the engine.
  virtual void Stop(std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Stop() followed by Start(). Also the way out of kUnavailable.
  virtual void Restart(
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Withdraws the pending notification, stops everything and waits for the
  // engine. No operation runs afterwards.
  virtual void Shutdown(
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Sends `files` to the discovered endpoint `endpoint_id`. Also retries a
  // failed or finished session.
  virtual void Send(absl::string_view endpoint_id,
                    std::vector<std::string> files,
                    std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Answers the pending inbound consent request.
  virtual void RespondToConsent(
      bool accept, std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Cancels the inbound transfer or the outbound session `transfer_id`.
  virtual void Cancel(
      absl::string_view transfer_id,
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Drops idle, failed and finished outbound sessions and restarts discovery.
  virtual void RefreshRecipients(
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  virtual void SetVisibility(
      bool visible, std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Renames the device. Restarts the engine, so it is refused while a
  // transfer is running.
  virtual void SetDeviceName(
      absl::string_view device_name,
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  virtual void StartDiscovery(
      std::function<void(StatusCodes)> status_codes_callback) = 0;
  virtual void StopDiscovery(
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // Runs the action of a notification button. `target` is the parameter the
  // button carried, if any.
  virtual void HandleNotificationAction(
      absl::string_view action_id, std::optional<std::string> target,
      std::function<void(StatusCodes)> status_codes_callback) = 0;

  // True while an outbound session requests consent or sends, or while the
  // inbound slot is held.
  virtual bool IsTransferActive() const = 0;

  virtual ServiceState GetServiceState() const = 0;

  // Outbound sessions, most recently discovered first.
  virtual std::vector<OutboundSession> GetOutboundSessions() const = 0;

  virtual std::optional<InboundSession> GetInboundSession() const = 0;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_TRANSFER_COORDINATOR_H_
