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

#include "sharing/task_supervisor.h"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "internal/test/fake_clock.h"
#include "internal/test/fake_task_runner.h"

namespace packet {
namespace sharing {
namespace {

using ::testing::ElementsAre;
using ::testing::MockFunction;

class TaskSupervisorTest : public ::testing::Test {
 protected:
  // Loop that spins until cancelled.
  static void RunUntilCancelled(const TaskHandle& handle) {
    while (!handle.IsCancelled()) {
      absl::SleepFor(absl::Milliseconds(1));
    }
  }

  FakeClock clock_;
  FakeTaskRunner runtime_runner_{&clock_, 2};
  FakeTaskRunner ui_runner_{&clock_, 1};
  TaskSupervisor supervisor_{&runtime_runner_, &ui_runner_};
};

TEST_F(TaskSupervisorTest, SpawnRunsLoopOnSchedulerRunner) {
  absl::Notification started;
  std::shared_ptr<TaskHandle> handle = supervisor_.Spawn(
      Scheduler::kUi, "ui_loop", [&started](const TaskHandle& handle) {
        started.Notify();
        RunUntilCancelled(handle);
      });

  EXPECT_TRUE(started.WaitForNotificationWithTimeout(absl::Seconds(1)));
  EXPECT_EQ(handle->scheduler(), Scheduler::kUi);
  EXPECT_EQ(supervisor_.size(), 1u);

  EXPECT_EQ(supervisor_.StopAll(), 1u);
  ui_runner_.Sync();
  EXPECT_TRUE(handle->IsCancelled());
  EXPECT_TRUE(handle->IsDone());
}

TEST_F(TaskSupervisorTest, StopAllCancelsNewestFirst) {
  std::vector<std::string> cancelled;
  supervisor_.Track(std::make_shared<TaskHandle>(
      "first", Scheduler::kRuntime,
      [&cancelled]() { cancelled.push_back("first"); }));
  supervisor_.Track(std::make_shared<TaskHandle>(
      "second", Scheduler::kUi,
      [&cancelled]() { cancelled.push_back("second"); }));
  supervisor_.Track(std::make_shared<TaskHandle>(
      "third", Scheduler::kRuntime,
      [&cancelled]() { cancelled.push_back("third"); }));

  EXPECT_EQ(supervisor_.StopAll(), 3u);

  EXPECT_THAT(cancelled, ElementsAre("third", "second", "first"));
}

TEST_F(TaskSupervisorTest, StopAllIsIdempotent) {
  supervisor_.Spawn(Scheduler::kRuntime, "relay", RunUntilCancelled);
  supervisor_.Spawn(Scheduler::kUi, "forward", RunUntilCancelled);

  EXPECT_EQ(supervisor_.StopAll(), 2u);
  EXPECT_EQ(supervisor_.size(), 0u);
  EXPECT_EQ(supervisor_.StopAll(), 0u);
  EXPECT_EQ(supervisor_.size(), 0u);
}

TEST_F(TaskSupervisorTest, StopAllOnEmptySupervisor) {
  EXPECT_EQ(supervisor_.StopAll(), 0u);
  EXPECT_EQ(supervisor_.size(), 0u);
}

TEST_F(TaskSupervisorTest, CancelCompletedHandle) {
  std::shared_ptr<TaskHandle> handle =
      supervisor_.Spawn(Scheduler::kUi, "one_shot", [](const TaskHandle&) {});
  ui_runner_.Sync();
  ASSERT_TRUE(handle->IsDone());

  EXPECT_EQ(supervisor_.StopAll(), 1u);
  EXPECT_TRUE(handle->IsCancelled());
}

TEST_F(TaskSupervisorTest, CancelHookRunsOnce) {
  MockFunction<void()> on_cancel;
  EXPECT_CALL(on_cancel, Call).Times(1);
  auto handle = std::make_shared<TaskHandle>("hooked", Scheduler::kUi,
                                             on_cancel.AsStdFunction());

  handle->Cancel();
  handle->Cancel();
}

TEST_F(TaskSupervisorTest, SpawnAfterShutdownMarksDone) {
  ui_runner_.Shutdown();

  std::shared_ptr<TaskHandle> handle =
      supervisor_.Spawn(Scheduler::kUi, "late", RunUntilCancelled);

  EXPECT_TRUE(handle->IsDone());
  EXPECT_EQ(supervisor_.StopAll(), 1u);
}

}  // namespace
}  // namespace sharing
}  // namespace packet
