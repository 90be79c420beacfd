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

#include "sharing/eta_estimator.h"

#include <cstdint>
#include <optional>
#include <string>

#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "internal/platform/clock.h"
#include "sharing/constants.h"
#include "sharing/internal/public/logging.h"

namespace packet {
namespace sharing {
namespace {

const char* Plural(int64_t n, const char* singular, const char* plural) {
  return n == 1 ? singular : plural;
}

}  // namespace

EtaEstimator::EtaEstimator(const Clock* clock, int64_t total_len)
    : clock_(clock), total_len_(total_len) {}

void EtaEstimator::StepWith(int64_t total_transferred) {
  if (total_transferred < total_transferred_) {
    // The engine restarted its counter. Take it as the new baseline.
    VLOG(1) << __func__ << ": counter went back from " << total_transferred_
            << " to " << total_transferred;
  } else {
    transferred_this_second_ += total_transferred - total_transferred_;
  }
  total_transferred_ = total_transferred;

  absl::Time now = clock_->Now();
  if (!last_second_.has_value()) {
    last_second_ = now;
    return;
  }
  if (now - *last_second_ < kEtaSampleInterval) {
    return;
  }

  ++seconds_elapsed_;
  last_second_ = now;
  if (history_.size() == kEtaHistoryCapacity) {
    history_.pop_back();
  }
  history_.push_front(transferred_this_second_);
  transferred_this_second_ = 0;
}

void EtaEstimator::PrepareForNewTransfer(std::optional<int64_t> total_len) {
  if (total_len.has_value()) {
    total_len_ = *total_len;
  }
  total_transferred_ = 0;
  transferred_this_second_ = 0;
  history_.clear();
  seconds_elapsed_ = 0;
  last_second_.reset();
}

EtaEstimator::Estimate EtaEstimator::GetEstimate() const {
  Estimate estimate;
  double sum = 0;
  for (int64_t sample : history_) {
    sum += static_cast<double>(sample);
  }
  if (!history_.empty()) {
    estimate.bytes_per_second = sum / static_cast<double>(history_.size());
  }
  estimate.remaining_bytes = total_len_ - total_transferred_;
  if (estimate.remaining_bytes < 0) {
    estimate.remaining_bytes = 0;
  }
  if (estimate.bytes_per_second > 0) {
    estimate.eta = absl::Seconds(static_cast<double>(estimate.remaining_bytes) /
                                 estimate.bytes_per_second);
  }
  return estimate;
}

std::string EtaEstimator::GetEstimateString() const {
  return FormatEta(GetEstimate().eta);
}

// static
std::string EtaEstimator::FormatEta(absl::Duration eta) {
  if (eta == absl::InfiniteDuration()) {
    return "Unknown";
  }
  int64_t seconds = absl::ToInt64Seconds(eta);
  if (seconds > kEtaHoursThresholdSeconds) {
    int64_t hours = seconds / 3600;
    int64_t minutes = (seconds % 3600) / 60;
    return absl::StrFormat("%d %s %d %s", hours,
                           Plural(hours, "hour", "hours"), minutes,
                           Plural(minutes, "minute", "minutes"));
  }
  if (seconds > kEtaMinutesThresholdSeconds) {
    int64_t minutes = seconds / 60;
    int64_t remainder = seconds % 60;
    return absl::StrFormat("%d %s %d %s", minutes,
                           Plural(minutes, "minute", "minutes"), remainder,
                           Plural(remainder, "second", "seconds"));
  }
  return absl::StrFormat("%d %s", seconds,
                         Plural(seconds, "second", "seconds"));
}

}  // namespace sharing
}  // namespace packet
