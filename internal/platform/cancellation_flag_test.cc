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

#include "internal/platform/cancellation_flag.h"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "internal/platform/cancellation_flag_listener.h"

namespace packet {
namespace {

TEST(CancellationFlagTest, InitialValueIsFalse) {
  CancellationFlag flag;

  EXPECT_FALSE(flag.Cancelled());
}

TEST(CancellationFlagTest, InitialValueAsTrue) {
  CancellationFlag flag{true};

  EXPECT_TRUE(flag.Cancelled());
}

TEST(CancellationFlagTest, CanCancel) {
  CancellationFlag flag;
  flag.Cancel();

  EXPECT_TRUE(flag.Cancelled());
}

TEST(CancellationFlagTest, ListenerRunsOnceOnRepeatedCancel) {
  testing::MockFunction<void()> mock_cancel_callback;
  EXPECT_CALL(mock_cancel_callback, Call).Times(1);

  CancellationFlag flag;
  CancellationFlagListener listener(&flag,
                                    mock_cancel_callback.AsStdFunction());
  flag.Cancel();
  flag.Cancel();

  EXPECT_TRUE(flag.Cancelled());
}

TEST(CancellationFlagTest, RemovedListenerIsNotCalled) {
  testing::MockFunction<void()> mock_cancel_callback;
  EXPECT_CALL(mock_cancel_callback, Call).Times(0);

  CancellationFlag flag;
  {
    CancellationFlagListener listener(&flag,
                                      mock_cancel_callback.AsStdFunction());
  }
  flag.Cancel();
}

}  // namespace
}  // namespace packet
