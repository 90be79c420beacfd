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

#ifndef PACKET_SHARING_ETA_ESTIMATOR_H_
#define PACKET_SHARING_ETA_ESTIMATOR_H_

#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "absl/time/time.h"
#include "internal/platform/clock.h"

namespace packet {
namespace sharing {

// Estimates the remaining time of a transfer from the bytes moved during the
// last few seconds.
//
// Callers feed the cumulative byte counter reported by the engine through
// StepWith(). Every time at least one second has passed since the previous
// sample, the bytes accumulated in between are pushed as one sample into a
// bounded history, newest first. The speed is the mean of that history.
//
// This class is not thread-safe.
class EtaEstimator {
 public:
  struct Estimate {
    double bytes_per_second = 0;
    int64_t remaining_bytes = 0;
    // absl::InfiniteDuration() when the speed is unknown.
    absl::Duration eta = absl::InfiniteDuration();
  };

  EtaEstimator(const Clock* clock, int64_t total_len);

  void StepWith(int64_t total_transferred);

  // Clears all progress. `total_len` replaces the transfer length if set.
  void PrepareForNewTransfer(std::optional<int64_t> total_len);

  Estimate GetEstimate() const;

  // Human readable form of GetEstimate(), e.g. "2 minutes 5 seconds".
  std::string GetEstimateString() const;

  // Renders `eta`. An infinite duration renders as "Unknown".
  static std::string FormatEta(absl::Duration eta);

  int64_t total_len() const { return total_len_; }
  int64_t total_transferred() const { return total_transferred_; }
  int64_t seconds_elapsed() const { return seconds_elapsed_; }
  const std::deque<int64_t>& history() const { return history_; }

 private:
  const Clock* const clock_;
  int64_t total_len_ = 0;
  int64_t total_transferred_ = 0;
  int64_t transferred_this_second_ = 0;
  std::deque<int64_t> history_;
  std::optional<absl::Time> last_second_;
  int64_t seconds_elapsed_ = 0;
};

}  // namespace sharing
}  // namespace packet

#endif  // PACKET_SHARING_ETA_ESTIMATOR_H_
