/*
 * transfer/uploader.cc
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

#include "transfer/uploader.h"

#include <stdexcept>

#include "transfer/coordinator.h"
#include "transfer/executor.h"
#include "transfer/transfer_outcome.h"

namespace s3bulk {
namespace transfer {

constexpr size_t Uploader::DEFAULT_MAX_CONCURRENT;

Uploader::Uploader(std::shared_ptr<const services::ObjectStore> store,
                   size_t max_concurrent)
    : store_(std::move(store)), max_concurrent_(max_concurrent) {
  if (!store_) throw std::invalid_argument("object store must not be null.");
  if (max_concurrent_ < 1)
    throw std::invalid_argument("max_concurrent must be at least 1.");
}

std::string Uploader::UploadOne(const std::string &bucket,
                                const std::string &key,
                                const std::string &local_path) const {
  return Executor::Upload(store_.get(), bucket, key, local_path);
}

BatchResult Uploader::UploadMany(const std::string &bucket,
                                 const std::vector<Upload> &uploads) const {
  std::vector<TransferDescriptor> descriptors;

  descriptors.reserve(uploads.size());
  for (const auto &upload : uploads)
    descriptors.push_back({upload.second, upload.first});

  return Coordinator::RunBatch(
      descriptors, max_concurrent_,
      [this, &bucket](const TransferDescriptor &d) {
        return Executor::Upload(store_.get(), bucket, d.object_key,
                                d.local_path);
      });
}

}  // namespace transfer
}  // namespace s3bulk
