/*
 * threads/worker.cc
 * -------------------------------------------------------------------------
 * Worker thread.
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

#include "threads/worker.h"

#include <memory>

#include "base/logger.h"
#include "threads/work_item_queue.h"

namespace s3bulk {
namespace threads {

std::unique_ptr<Worker> Worker::Create(WorkItemQueue *queue,
                                       const std::string &id) {
  return std::unique_ptr<Worker>(new Worker(queue, id));
}

Worker::Worker(WorkItemQueue *queue, const std::string &id)
    : queue_(queue), id_(id), thread_(&Worker::Work, this) {}

Worker::~Worker() { thread_.join(); }

void Worker::Work() {
  while (true) {
    auto item = queue_->GetNext();
    if (!item.valid()) break;
    item.Run();
    ++items_run_;
  }

  S3BULK_LOG(LOG_DEBUG, "Worker::Work", "[%s] exiting after %" PRIu64
                                        " items.\n",
             id_.c_str(), items_run_);
}

}  // namespace threads
}  // namespace s3bulk
