/*
 * transfer/batch_result.cc
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

#include "transfer/batch_result.h"

#include <sstream>
#include <utility>

namespace s3bulk {
namespace transfer {

BatchResult BatchResult::Aggregate(
    const std::vector<TransferOutcome> &outcomes) {
  std::vector<std::string> successful;
  std::vector<FailedTransfer> failed;

  for (const auto &outcome : outcomes) {
    if (outcome.succeeded())
      successful.push_back(outcome.path());
    else
      failed.push_back({outcome.key(), outcome.message()});
  }

  return BatchResult(std::move(successful), std::move(failed));
}

BatchResult::BatchResult(std::vector<std::string> successful,
                         std::vector<FailedTransfer> failed)
    : successful_(std::move(successful)), failed_(std::move(failed)) {}

double BatchResult::success_rate() const {
  const size_t total = total_count();
  if (total == 0) return 0.0;
  return static_cast<double>(successful_.size()) / total;
}

std::string BatchResult::ToString() const {
  std::ostringstream s;
  s << "BatchResult: " << successful_.size() << " successful, "
    << failed_.size() << " failed";
  return s.str();
}

}  // namespace transfer
}  // namespace s3bulk
