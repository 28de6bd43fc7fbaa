/*
 * transfer/executor.h
 * -------------------------------------------------------------------------
 * Moves one object between the store and a local file.
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

#ifndef S3BULK_TRANSFER_EXECUTOR_H
#define S3BULK_TRANSFER_EXECUTOR_H

#include <string>

namespace s3bulk {
namespace services {
class ObjectStore;
}

namespace transfer {
// Both operations return |local_path| and throw base::RemoteError for
// store-side failures or base::IoError for local ones. Neither retries.
class Executor {
 public:
  // The destination is created (or truncated) only after the store has
  // accepted the request. Bytes written before a failure are left in place.
  static std::string Download(const services::ObjectStore *store,
                              const std::string &bucket,
                              const std::string &key,
                              const std::string &local_path);

  static std::string Upload(const services::ObjectStore *store,
                            const std::string &bucket, const std::string &key,
                            const std::string &local_path);
};
}  // namespace transfer
}  // namespace s3bulk

#endif
