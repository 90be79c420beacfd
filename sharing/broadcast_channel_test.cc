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

#include "sharing/broadcast_channel.h"

#include <thread>  // NOLINT

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

namespace packet::sharing {
namespace {

constexpr absl::Duration kTimeout = absl::Milliseconds(10);

TEST(BroadcastChannelTest, EverySubscriberSeesEveryValue) {
  BroadcastChannel<int> channel(4);
  auto first = channel.Subscribe();
  auto second = channel.Subscribe();

  EXPECT_TRUE(channel.Send(1));
  EXPECT_TRUE(channel.Send(2));

  EXPECT_EQ(*first.Receive(kTimeout), 1);
  EXPECT_EQ(*first.Receive(kTimeout), 2);
  EXPECT_EQ(*second.Receive(kTimeout), 1);
  EXPECT_EQ(*second.Receive(kTimeout), 2);
}

TEST(BroadcastChannelTest, SubscriberOnlySeesLaterValues) {
  BroadcastChannel<int> channel(4);
  channel.Send(1);
  auto receiver = channel.Subscribe();
  channel.Send(2);

  EXPECT_EQ(*receiver.Receive(kTimeout), 2);
}

TEST(BroadcastChannelTest, EmptyChannelTimesOut) {
  BroadcastChannel<int> channel(4);
  auto receiver = channel.Subscribe();

  EXPECT_EQ(receiver.Receive(kTimeout).status().code(),
            absl::StatusCode::kDeadlineExceeded);
}

TEST(BroadcastChannelTest, LaggingSubscriberSkipsOldestValues) {
  BroadcastChannel<int> channel(2);
  auto receiver = channel.Subscribe();
  channel.Send(1);
  channel.Send(2);
  channel.Send(3);

  EXPECT_EQ(receiver.Receive(kTimeout).status().code(),
            absl::StatusCode::kResourceExhausted);
  EXPECT_EQ(*receiver.Receive(kTimeout), 2);
  EXPECT_EQ(*receiver.Receive(kTimeout), 3);
}

TEST(BroadcastChannelTest, ClosedChannelDrainsThenReportsClosed) {
  BroadcastChannel<int> channel(2);
  auto receiver = channel.Subscribe();
  channel.Send(1);
  channel.Close();

  EXPECT_FALSE(channel.Send(2));
  EXPECT_TRUE(channel.IsClosed());
  EXPECT_EQ(*receiver.Receive(kTimeout), 1);
  EXPECT_EQ(receiver.Receive(kTimeout).status().code(),
            absl::StatusCode::kOutOfRange);
}

TEST(BroadcastChannelTest, ReceiveWakesOnSend) {
  BroadcastChannel<int> channel(2);
  auto receiver = channel.Subscribe();
  std::thread sender([&channel]() {
    absl::SleepFor(absl::Milliseconds(20));
    channel.Send(42);
  });

  absl::StatusOr<int> value = receiver.Receive(absl::Seconds(5));
  sender.join();

  ASSERT_TRUE(value.ok());
  EXPECT_EQ(*value, 42);
}

}  // namespace
}  // namespace packet::sharing
