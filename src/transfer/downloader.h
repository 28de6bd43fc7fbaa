/*
 * transfer/downloader.h
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

#ifndef S3BULK_TRANSFER_DOWNLOADER_H
#define S3BULK_TRANSFER_DOWNLOADER_H

#include <memory>
#include <string>
#include <vector>

#include "services/object_store.h"
#include "transfer/batch_result.h"
#include "transfer/transfer_outcome.h"

namespace s3bulk {
namespace transfer {
class Downloader {
 public:
  static constexpr size_t DEFAULT_MAX_CONCURRENT = 5;

  // Throws std::invalid_argument if |max_concurrent| is 0.
  explicit Downloader(std::shared_ptr<const services::ObjectStore> store,
                      size_t max_concurrent = DEFAULT_MAX_CONCURRENT);

  // Returns |local_path|. Throws on failure.
  std::string DownloadOne(const std::string &bucket, const std::string &key,
                          const std::string &local_path) const;

  // Stores each object under |base_directory|, named after the last segment
  // of its key. Throws base::BatchSetupError if |base_directory| cannot be
  // created.
  BatchResult DownloadMany(const std::string &bucket,
                           const std::vector<std::string> &keys,
                           const std::string &base_directory) const;

  // Creates each destination's parent directory as part of its transfer.
  BatchResult DownloadManyWithPaths(
      const std::string &bucket,
      const std::vector<TransferDescriptor> &downloads) const;

  inline size_t max_concurrent() const { return max_concurrent_; }

 private:
  std::string DownloadItem(const std::string &bucket,
                           const TransferDescriptor &d,
                           bool ensure_parent) const;

  std::shared_ptr<const services::ObjectStore> store_;
  size_t max_concurrent_;
};
}  // namespace transfer
}  // namespace s3bulk

#endif
