/*
 * transfer/downloader.cc
 * -------------------------------------------------------------------------
 * Downloads objects to local files.
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

#include "transfer/downloader.h"

#include <atomic>
#include <stdexcept>
#include <utility>

#include "base/errors.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "transfer/coordinator.h"
#include "transfer/executor.h"
#include "transfer/path_resolver.h"

namespace s3bulk {
namespace transfer {

constexpr size_t Downloader::DEFAULT_MAX_CONCURRENT;

namespace {
std::atomic_int s_setup_failures(0), s_unresolvable_keys(0);

void StatsWriter(std::ostream *o) {
  *o << "downloader:\n"
        "  batch setup failures: "
     << s_setup_failures
     << "\n"
        "  unresolvable keys: "
     << s_unresolvable_keys << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

Downloader::Downloader(std::shared_ptr<const services::ObjectStore> store,
                       size_t max_concurrent)
    : store_(std::move(store)), max_concurrent_(max_concurrent) {
  if (!store_) throw std::invalid_argument("object store must not be null.");
  if (max_concurrent_ < 1)
    throw std::invalid_argument("max_concurrent must be at least 1.");
}

std::string Downloader::DownloadOne(const std::string &bucket,
                                    const std::string &key,
                                    const std::string &local_path) const {
  return Executor::Download(store_.get(), bucket, key, local_path);
}

BatchResult Downloader::DownloadMany(const std::string &bucket,
                                     const std::vector<std::string> &keys,
                                     const std::string &base_directory) const {
  std::vector<TransferDescriptor> downloads;
  std::vector<FailedTransfer> unresolvable;

  try {
    PathResolver::EnsureDirectory(base_directory);
  } catch (const std::exception &e) {
    ++s_setup_failures;
    S3BULK_LOG(LOG_ERR, "Downloader::DownloadMany",
               "cannot prepare base directory [%s]: %s\n",
               base_directory.c_str(), e.what());
    throw base::BatchSetupError(std::string("Failed to create directory: ") +
                                e.what());
  }

  downloads.reserve(keys.size());

  for (const auto &key : keys) {
    try {
      downloads.push_back(
          {key, PathResolver::ResolveForDirectory(key, base_directory)});
    } catch (const std::invalid_argument &e) {
      ++s_unresolvable_keys;
      unresolvable.push_back({key, e.what()});
    }
  }

  BatchResult result = Coordinator::RunBatch(
      downloads, max_concurrent_,
      [this, &bucket](const TransferDescriptor &d) {
        return DownloadItem(bucket, d, false);
      },
      Coordinator::PathPolicy::UNIQUE);

  if (unresolvable.empty()) return result;

  // keys that cannot name a file failed before anything ran
  unresolvable.insert(unresolvable.end(), result.failed().begin(),
                      result.failed().end());

  return BatchResult(result.successful(), std::move(unresolvable));
}

BatchResult Downloader::DownloadManyWithPaths(
    const std::string &bucket,
    const std::vector<TransferDescriptor> &downloads) const {
  return Coordinator::RunBatch(
      downloads, max_concurrent_,
      [this, &bucket](const TransferDescriptor &d) {
        return DownloadItem(bucket, d, true);
      },
      Coordinator::PathPolicy::UNIQUE);
}

std::string Downloader::DownloadItem(const std::string &bucket,
                                     const TransferDescriptor &d,
                                     bool ensure_parent) const {
  if (ensure_parent) PathResolver::EnsureParentDirectory(d.local_path);

  return Executor::Download(store_.get(), bucket, d.object_key, d.local_path);
}

}  // namespace transfer
}  // namespace s3bulk
