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

#include "internal/platform/task_runner_impl.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "gtest/gtest.h"
#include "absl/synchronization/blocking_counter.h"
#include "absl/synchronization/notification.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace packet {
namespace {

class TaskRunnerImplTest : public ::testing::TestWithParam<uint32_t> {};

TEST_P(TaskRunnerImplTest, PostTask) {
  TaskRunnerImpl task_runner{GetParam()};
  absl::Notification notification;
  std::atomic_bool called = false;

  EXPECT_TRUE(task_runner.PostTask([&called, &notification]() {
    called = true;
    notification.Notify();
  }));
  EXPECT_TRUE(notification.WaitForNotificationWithTimeout(absl::Seconds(1)));
  EXPECT_TRUE(called);
}

TEST(TaskRunnerImplSequenceTest, SingleRunnerKeepsPostingOrder) {
  TaskRunnerImpl task_runner{1};
  std::vector<std::string> completed_tasks;
  absl::Notification notification;

  task_runner.PostTask([&completed_tasks]() {
    absl::SleepFor(absl::Milliseconds(20));
    completed_tasks.push_back("task1");
  });
  task_runner.PostTask([&completed_tasks, &notification]() {
    completed_tasks.push_back("task2");
    notification.Notify();
  });

  ASSERT_TRUE(notification.WaitForNotificationWithTimeout(absl::Seconds(1)));
  ASSERT_EQ(completed_tasks.size(), 2u);
  EXPECT_EQ(completed_tasks[0], "task1");
  EXPECT_EQ(completed_tasks[1], "task2");
}

TEST_P(TaskRunnerImplTest, PostDelayedTaskRunsAfterImmediateTask) {
  TaskRunnerImpl task_runner{GetParam()};
  std::atomic_bool delayed_task_started = false;
  absl::BlockingCounter counter(2);

  task_runner.PostDelayedTask(absl::Milliseconds(50), [&]() {
    delayed_task_started = true;
    counter.DecrementCount();
  });
  task_runner.PostTask([&]() {
    EXPECT_FALSE(delayed_task_started);
    counter.DecrementCount();
  });

  counter.Wait();
}

TEST_P(TaskRunnerImplTest, DelayedTasksRunInDeadlineOrder) {
  TaskRunnerImpl task_runner{GetParam()};
  std::atomic_bool long_task_started = false;
  absl::BlockingCounter counter(2);

  task_runner.PostDelayedTask(absl::Milliseconds(300), [&]() {
    long_task_started = true;
    counter.DecrementCount();
  });
  task_runner.PostDelayedTask(absl::Milliseconds(1), [&]() {
    EXPECT_FALSE(long_task_started);
    counter.DecrementCount();
  });

  counter.Wait();
}

TEST_P(TaskRunnerImplTest, PostMultipleTasks) {
  TaskRunnerImpl task_runner(GetParam());
  constexpr int kNumTasks = 10;
  absl::BlockingCounter counter(kNumTasks);

  for (int i = 0; i < kNumTasks; i++) {
    task_runner.PostTask([&]() {
      absl::SleepFor(absl::Milliseconds(5));
      counter.DecrementCount();
    });
  }

  counter.Wait();
}

TEST_P(TaskRunnerImplTest, PostEmptyTask) {
  TaskRunnerImpl task_runner{GetParam()};
  EXPECT_TRUE(task_runner.PostTask(nullptr));
  EXPECT_TRUE(task_runner.PostDelayedTask(absl::Milliseconds(100), nullptr));
}

TEST_P(TaskRunnerImplTest, PostAfterShutdownFails) {
  TaskRunnerImpl task_runner{GetParam()};
  task_runner.Shutdown();

  EXPECT_FALSE(task_runner.PostTask([]() {}));
  EXPECT_FALSE(task_runner.PostDelayedTask(absl::Milliseconds(1), []() {}));
}

TEST_P(TaskRunnerImplTest, ShutdownDropsPendingDelayedTasks) {
  std::atomic_bool called = false;
  {
    TaskRunnerImpl task_runner{GetParam()};
    task_runner.PostDelayedTask(absl::Seconds(10), [&called]() {
      called = true;
    });
  }
  EXPECT_FALSE(called);
}

INSTANTIATE_TEST_SUITE_P(TaskRunnerImplTests, TaskRunnerImplTest,
                         ::testing::Values(1u, 4u));

}  // namespace
}  // namespace packet
