/*
 * transfer/path_resolver.h
 * -------------------------------------------------------------------------
 * Local path derivation and directory provisioning.
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

#ifndef S3BULK_TRANSFER_PATH_RESOLVER_H
#define S3BULK_TRANSFER_PATH_RESOLVER_H

#include <string>

namespace s3bulk {
namespace transfer {
class PathResolver {
 public:
  // Joins the final segment of |object_key| under |base_directory|, ignoring
  // trailing slashes on the key. Throws std::invalid_argument if that segment
  // is empty, "." or "..".
  static std::string ResolveForDirectory(const std::string &object_key,
                                         const std::string &base_directory);

  // Creates |directory| and any missing ancestors. Throws base::IoError.
  static void EnsureDirectory(const std::string &directory);

  // No-op if |local_path| has no directory component.
  static void EnsureParentDirectory(const std::string &local_path);
};
}  // namespace transfer
}  // namespace s3bulk

#endif
