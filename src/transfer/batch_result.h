/*
 * transfer/batch_result.h
 * -------------------------------------------------------------------------
 * Aggregated outcome of a transfer batch.
 * -------------------------------------------------------------------------
 *
 * Copyright (c) 2012, Tarick Bedeir.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef S3BULK_TRANSFER_BATCH_RESULT_H
#define S3BULK_TRANSFER_BATCH_RESULT_H

#include <string>
#include <vector>

#include "transfer/transfer_outcome.h"

namespace s3bulk {
namespace transfer {
class BatchResult {
 public:
  // Partitions |outcomes| into successes and failures, keeping their
  // relative order.
  static BatchResult Aggregate(const std::vector<TransferOutcome> &outcomes);

  BatchResult() = default;
  BatchResult(std::vector<std::string> successful,
              std::vector<FailedTransfer> failed);

  inline const std::vector<std::string> &successful() const {
    return successful_;
  }
  inline const std::vector<FailedTransfer> &failed() const { return failed_; }

  inline size_t total_count() const {
    return successful_.size() + failed_.size();
  }

  // 0.0 for an empty batch.
  double success_rate() const;

  inline bool is_complete_success() const { return failed_.empty(); }
  inline bool has_success() const { return !successful_.empty(); }
  inline bool has_failures() const { return !failed_.empty(); }

  std::string ToString() const;

 private:
  std::vector<std::string> successful_;
  std::vector<FailedTransfer> failed_;
};
}  // namespace transfer
}  // namespace s3bulk

#endif
