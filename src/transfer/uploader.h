/*
 * transfer/uploader.h
 * -------------------------------------------------------------------------
 * Uploads local files as objects.
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

#ifndef S3BULK_TRANSFER_UPLOADER_H
#define S3BULK_TRANSFER_UPLOADER_H

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "services/object_store.h"
#include "transfer/batch_result.h"

namespace s3bulk {
namespace transfer {
class Uploader {
 public:
  static constexpr size_t DEFAULT_MAX_CONCURRENT = 5;

  // (local path, object key)
  using Upload = std::pair<std::string, std::string>;

  // Throws std::invalid_argument if |max_concurrent| is 0.
  explicit Uploader(std::shared_ptr<const services::ObjectStore> store,
                    size_t max_concurrent = DEFAULT_MAX_CONCURRENT);

  // Returns |local_path|. Throws on failure.
  std::string UploadOne(const std::string &bucket, const std::string &key,
                        const std::string &local_path) const;

  // Failures are reported under the object key.
  BatchResult UploadMany(const std::string &bucket,
                         const std::vector<Upload> &uploads) const;

  inline size_t max_concurrent() const { return max_concurrent_; }

 private:
  std::shared_ptr<const services::ObjectStore> store_;
  size_t max_concurrent_;
};
}  // namespace transfer
}  // namespace s3bulk

#endif
