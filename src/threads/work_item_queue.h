/*
 * threads/work_item_queue.h
 * -------------------------------------------------------------------------
 * Queue of pending work items shared by a pool's workers.
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

#ifndef S3BULK_THREADS_WORK_ITEM_QUEUE_H
#define S3BULK_THREADS_WORK_ITEM_QUEUE_H

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

#include "threads/work_item.h"

namespace s3bulk {
namespace threads {
class WorkItemQueue {
 public:
  inline WorkItemQueue() = default;

  // Blocks until an item is available. Returns an invalid item once the
  // queue is closed and drained.
  inline WorkItem GetNext() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!closed_ && queue_.empty()) condition_.wait(lock);
    if (queue_.empty()) return {};  // generates an invalid work item
    auto item = std::move(queue_.front());
    queue_.pop_front();
    return item;
  }

  inline void Post(WorkItem item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) throw std::runtime_error("cannot post to a closed queue.");
    queue_.push_back(std::move(item));
    condition_.notify_one();
  }

  // Items already posted still run; workers exit once none remain.
  inline void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    condition_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<WorkItem> queue_;
  bool closed_ = false;
};
}  // namespace threads
}  // namespace s3bulk

#endif
