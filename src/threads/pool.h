/*
 * threads/pool.h
 * -------------------------------------------------------------------------
 * Fixed-size pool of worker threads.
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

#ifndef S3BULK_THREADS_POOL_H
#define S3BULK_THREADS_POOL_H

#include <list>
#include <memory>
#include <string>

#include "threads/work_item.h"
#include "threads/work_item_queue.h"

namespace s3bulk {
namespace threads {
class Worker;

// Work posted to a pool runs on at most |num_workers| threads at once; the
// rest waits in FIFO order for a free worker.
class Pool {
 public:
  Pool(const std::string &id, size_t num_workers);

  // Runs everything already posted, then joins the workers.
  ~Pool();

  void Post(WorkItem::WorkerFunction fn, WorkItem::CallbackFunction cb);

  inline size_t size() const { return num_workers_; }
  inline const std::string &id() const { return id_; }

 private:
  std::string id_;
  size_t num_workers_;
  WorkItemQueue queue_;
  std::list<std::unique_ptr<Worker>> workers_;
};
}  // namespace threads
}  // namespace s3bulk

#endif
