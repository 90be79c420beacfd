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

#include "sharing/event_relay.h"

#include <string>
#include <thread>  // NOLINT
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/synchronization/mutex.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "internal/platform/task_runner_impl.h"
#include "sharing/broadcast_channel.h"
#include "sharing/task_supervisor.h"
#include "sharing/worker_queue.h"

namespace packet::sharing {
namespace {

using ::testing::ElementsAre;

class EventRelayTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(queue_.Start([this](int value) {
      absl::MutexLock lock(&mutex_);
      received_.push_back(value);
    }));
  }

  // Waits for the callbacks posted so far.
  std::vector<int> received() {
    absl::Notification synced;
    task_runner_.PostTask([&synced]() { synced.Notify(); });
    synced.WaitForNotification();
    absl::MutexLock lock(&mutex_);
    return received_;
  }

  absl::Mutex mutex_;
  std::vector<int> received_;
  TaskRunnerImpl task_runner_{1};
  WorkerQueue<int> queue_{&task_runner_, 1};
  BroadcastChannel<int> channel_{10};
  BroadcastChannel<int>::Receiver receiver_ = channel_.Subscribe();
  TaskHandle handle_{"relay", Scheduler::kRuntime};
};

TEST_F(EventRelayTest, RelaysInOrderUntilFeedCloses) {
  channel_.Send(1);
  channel_.Send(2);
  channel_.Send(3);
  channel_.Close();

  EXPECT_EQ(RelayUntilCancelled<int>(handle_, receiver_, queue_),
            RelayResult::kFeedClosed);
  EXPECT_THAT(received(), ElementsAre(1, 2, 3));
}

TEST_F(EventRelayTest, SkipsLaggedValues) {
  BroadcastChannel<int> small_channel(2);
  BroadcastChannel<int>::Receiver receiver = small_channel.Subscribe();
  for (int i = 1; i <= 5; ++i) {
    small_channel.Send(i);
  }
  small_channel.Close();

  EXPECT_EQ(RelayUntilCancelled<int>(handle_, receiver, queue_),
            RelayResult::kFeedClosed);
  EXPECT_THAT(received(), ElementsAre(4, 5));
}

TEST_F(EventRelayTest, StopsWhenCancelled) {
  absl::Notification done;
  RelayResult result = RelayResult::kFeedClosed;
  std::thread relay([&]() {
    result = RelayUntilCancelled<int>(handle_, receiver_, queue_);
    done.Notify();
  });

  channel_.Send(7);
  handle_.Cancel();

  EXPECT_TRUE(done.WaitForNotificationWithTimeout(absl::Seconds(5)));
  relay.join();
  EXPECT_EQ(result, RelayResult::kCancelled);
}

TEST_F(EventRelayTest, CancelledBeforeCloseIsNotAFailure) {
  handle_.Cancel();
  channel_.Close();

  EXPECT_EQ(RelayUntilCancelled<int>(handle_, receiver_, queue_),
            RelayResult::kCancelled);
}

TEST_F(EventRelayTest, StopsWhenQueueStops) {
  queue_.Stop();
  channel_.Send(1);

  EXPECT_EQ(RelayUntilCancelled<int>(handle_, receiver_, queue_),
            RelayResult::kQueueStopped);
  EXPECT_TRUE(received().empty());
}

}  // namespace
}  // namespace packet::sharing
