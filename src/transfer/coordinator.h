/*
 * transfer/coordinator.h
 * -------------------------------------------------------------------------
 * Runs a batch of transfers with bounded concurrency.
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

#ifndef S3BULK_TRANSFER_COORDINATOR_H
#define S3BULK_TRANSFER_COORDINATOR_H

#include <functional>
#include <string>
#include <vector>

#include "transfer/batch_result.h"
#include "transfer/transfer_outcome.h"

namespace s3bulk {
namespace transfer {
class Coordinator {
 public:
  // Transfers one item and returns the path to report on success. Throws on
  // failure.
  using Operation = std::function<std::string(const TransferDescriptor &)>;

  enum class PathPolicy {
    // Several descriptors may name the same local path (uploads).
    SHARED,
    // Only the first descriptor naming a local path is transferred; later
    // ones fail without reaching the store (downloads).
    UNIQUE
  };

  // Runs |operation| for every descriptor, at most |concurrency_limit| at a
  // time, and returns one outcome per descriptor in completion order. Throws
  // std::invalid_argument if |concurrency_limit| is 0.
  static BatchResult RunBatch(
      const std::vector<TransferDescriptor> &descriptors,
      size_t concurrency_limit, const Operation &operation,
      PathPolicy path_policy = PathPolicy::SHARED);
};
}  // namespace transfer
}  // namespace s3bulk

#endif
