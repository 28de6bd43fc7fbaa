/*
 * transfer/coordinator.cc
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

#include "transfer/coordinator.h"

#include <atomic>
#include <set>
#include <stdexcept>
#include <utility>

#include "base/errors.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "threads/fan_out.h"

namespace s3bulk {
namespace transfer {

namespace {
constexpr char DUPLICATE_PATH_MESSAGE[] = "duplicate destination path";

std::atomic_int s_batches(0), s_items(0), s_items_failed(0);
std::atomic_int s_duplicates_rejected(0), s_start_failures(0);

void StatsWriter(std::ostream *o) {
  *o << "batches:\n"
        "  batches run: "
     << s_batches
     << "\n"
        "  items: "
     << s_items
     << "\n"
        "  items failed: "
     << s_items_failed
     << "\n"
        "  duplicate paths rejected: "
     << s_duplicates_rejected
     << "\n"
        "  batches that failed to start: "
     << s_start_failures << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

BatchResult Coordinator::RunBatch(
    const std::vector<TransferDescriptor> &descriptors,
    size_t concurrency_limit, const Operation &operation,
    PathPolicy path_policy) {
  if (concurrency_limit < 1)
    throw std::invalid_argument("concurrency limit must be at least 1.");

  if (descriptors.empty()) return BatchResult();

  std::vector<TransferOutcome> outcomes;
  std::vector<TransferDescriptor> accepted;

  outcomes.reserve(descriptors.size());

  if (path_policy == PathPolicy::UNIQUE) {
    std::set<std::string> paths;

    for (const auto &d : descriptors) {
      if (paths.insert(d.local_path).second) {
        accepted.push_back(d);
        continue;
      }

      S3BULK_LOG(LOG_WARNING, "Coordinator::RunBatch",
                 "rejecting [%s]: another item already writes [%s].\n",
                 d.object_key.c_str(), d.local_path.c_str());
      ++s_duplicates_rejected;
      outcomes.push_back(
          TransferOutcome::Failure(d.object_key, DUPLICATE_PATH_MESSAGE));
    }
  } else {
    accepted = descriptors;
  }

  const double start = base::Timer::GetCurrentTime();

  S3BULK_LOG(LOG_INFO, "Coordinator::RunBatch",
             "starting batch of %zu items with concurrency limit %zu.\n",
             descriptors.size(), concurrency_limit);

  threads::FanOut<TransferDescriptor, TransferOutcome> fan_out(
      accepted.begin(), accepted.end(), concurrency_limit,
      [&operation](const TransferDescriptor &d) {
        return TransferOutcome::Success(operation(d));
      },
      [](const TransferDescriptor &d, const std::string &message) {
        S3BULK_LOG(LOG_WARNING, "Coordinator::RunBatch",
                   "transfer of [%s] failed: %s\n", d.object_key.c_str(),
                   message.c_str());
        return TransferOutcome::Failure(d.object_key, message);
      });

  // per-item errors never leave Process(), so whatever does is batch-wide
  // (e.g. no threads left for the workers)
  std::vector<TransferOutcome> processed;
  try {
    processed = fan_out.Process();
  } catch (const std::exception &e) {
    ++s_start_failures;
    S3BULK_LOG(LOG_ERR, "Coordinator::RunBatch",
               "batch of %zu items failed to run: %s\n", descriptors.size(),
               e.what());
    throw base::BatchSetupError(std::string("Failed to start batch: ") +
                                e.what());
  }

  for (auto &outcome : processed) outcomes.push_back(std::move(outcome));

  BatchResult result = BatchResult::Aggregate(outcomes);

  ++s_batches;
  s_items += result.total_count();
  s_items_failed += result.failed().size();

  S3BULK_LOG(LOG_INFO, "Coordinator::RunBatch", "%s in %.3f s.\n",
             result.ToString().c_str(), base::Timer::GetCurrentTime() - start);

  return result;
}

}  // namespace transfer
}  // namespace s3bulk
