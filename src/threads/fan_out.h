/*
 * threads/fan_out.h
 * -------------------------------------------------------------------------
 * Runs a set of independent items on a bounded pool and collects their
 * results in completion order.
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

#ifndef S3BULK_THREADS_FAN_OUT_H
#define S3BULK_THREADS_FAN_OUT_H

#include <errno.h>
#include <string.h>

#include <algorithm>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "base/logger.h"
#include "threads/pool.h"

namespace s3bulk {
namespace threads {
template <class Item, class Result>
class FanOut {
 public:
  using ProcessItemCallback = std::function<Result(const Item &)>;
  // Builds the result for an item whose processing threw.
  using FailItemCallback =
      std::function<Result(const Item &, const std::string &)>;

  template <class Iterator>
  inline FanOut(Iterator begin, Iterator end, size_t max_items_in_progress,
                const ProcessItemCallback &on_process_item,
                const FailItemCallback &on_fail_item)
      : items_(begin, end),
        max_items_in_progress_(max_items_in_progress),
        on_process_item_(on_process_item),
        on_fail_item_(on_fail_item) {
    if (max_items_in_progress_ < 1)
      throw std::invalid_argument("at least one item must be in progress.");
  }

  // Returns exactly one result per item, in the order the items finished.
  std::vector<Result> Process() {
    results_.clear();
    results_.reserve(items_.size());

    if (items_.empty()) return {};

    {
      Pool pool("fan_out", std::min(max_items_in_progress_, items_.size()));

      for (const auto &item : items_) {
        const Item *p = &item;
        pool.Post([this, p]() { return ProcessItem(p); },
                  [this, p](int r) { OnItemCompleted(p, r); });
      }

      std::unique_lock<std::mutex> lock(mutex_);
      while (results_.size() < items_.size()) condition_.wait(lock);
    }

    return std::move(results_);
  }

 private:
  int ProcessItem(const Item *item) {
    try {
      AddResult(on_process_item_(*item));
    } catch (const std::exception &e) {
      AddResult(on_fail_item_(*item, e.what()));
    }
    return 0;
  }

  void OnItemCompleted(const Item *item, int r) {
    // non-zero only if something other than a std::exception escaped
    // ProcessItem(), in which case no result has been added yet
    if (r == 0) return;

    S3BULK_LOG(LOG_WARNING, "FanOut::OnItemCompleted",
               "item failed with status %i.\n", r);
    AddResult(on_fail_item_(*item, strerror(-r)));
  }

  void AddResult(Result result) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(std::move(result));
    condition_.notify_all();
  }

  const std::vector<Item> items_;
  const size_t max_items_in_progress_;
  const ProcessItemCallback on_process_item_;
  const FailItemCallback on_fail_item_;

  std::mutex mutex_;
  std::condition_variable condition_;
  std::vector<Result> results_;
};
}  // namespace threads
}  // namespace s3bulk

#endif
