/*
 * threads/pool.cc
 * -------------------------------------------------------------------------
 * Implements a pool of worker threads.
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

#include "threads/pool.h"

#include <stdexcept>

#include "base/logger.h"
#include "threads/worker.h"

namespace s3bulk {
namespace threads {

Pool::Pool(const std::string &id, size_t num_workers)
    : id_(id), num_workers_(num_workers) {
  if (num_workers_ == 0)
    throw std::invalid_argument("pool needs at least one worker.");

  try {
    for (size_t i = 0; i < num_workers_; i++)
      workers_.push_back(
          Worker::Create(&queue_, id_ + "." + std::to_string(i)));
  } catch (const std::exception &e) {
    S3BULK_LOG(LOG_ERR, "Pool::Pool", "[%s] failed to start workers: %s\n",
               id_.c_str(), e.what());
    // workers that did start must be released before they can be joined
    queue_.Close();
    workers_.clear();
    throw;
  }

  S3BULK_LOG(LOG_DEBUG, "Pool::Pool", "[%s] started %zu workers.\n",
             id_.c_str(), num_workers_);
}

Pool::~Pool() {
  queue_.Close();
  workers_.clear();
}

void Pool::Post(WorkItem::WorkerFunction fn, WorkItem::CallbackFunction cb) {
  queue_.Post(WorkItem(std::move(fn), std::move(cb)));
}

}  // namespace threads
}  // namespace s3bulk
