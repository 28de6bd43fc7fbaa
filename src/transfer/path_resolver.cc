/*
 * transfer/path_resolver.cc
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

#include "transfer/path_resolver.h"

#include <errno.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <stdexcept>

#include "base/errors.h"
#include "base/logger.h"

namespace s3bulk {
namespace transfer {

namespace {
constexpr mode_t DIRECTORY_MODE = 0755;

// Returns 0 or a positive errno value.
int MakeDirectory(const std::string &path) {
  if (mkdir(path.c_str(), DIRECTORY_MODE) == 0) return 0;

  const int error = errno;
  struct stat s;

  if (error != EEXIST) return error;
  if (stat(path.c_str(), &s) != 0) return errno;
  return S_ISDIR(s.st_mode) ? 0 : ENOTDIR;
}
}  // namespace

std::string PathResolver::ResolveForDirectory(
    const std::string &object_key, const std::string &base_directory) {
  const auto end = object_key.find_last_not_of('/');
  if (end == std::string::npos)
    throw std::invalid_argument("object key [" + object_key +
                                "] does not name a file.");

  const auto slash = object_key.rfind('/', end);
  const std::string name =
      (slash == std::string::npos)
          ? object_key.substr(0, end + 1)
          : object_key.substr(slash + 1, end - slash);

  if (name == "." || name == "..")
    throw std::invalid_argument("object key [" + object_key +
                                "] does not name a file.");

  if (base_directory.empty()) return name;
  if (base_directory.back() == '/') return base_directory + name;
  return base_directory + "/" + name;
}

void PathResolver::EnsureDirectory(const std::string &directory) {
  if (directory.empty()) return;

  size_t pos = 0;
  while (pos != std::string::npos) {
    pos = directory.find('/', pos + 1);

    const std::string prefix = directory.substr(0, pos);
    if (prefix.empty() || prefix.back() == '/') continue;

    const int r = MakeDirectory(prefix);
    if (r) {
      S3BULK_LOG(LOG_DEBUG, "PathResolver::EnsureDirectory",
                 "cannot create [%s] for [%s]: %i\n", prefix.c_str(),
                 directory.c_str(), r);
      throw base::IoError(prefix, r, "create directory");
    }
  }
}

void PathResolver::EnsureParentDirectory(const std::string &local_path) {
  const auto slash = local_path.rfind('/');
  if (slash == std::string::npos) return;

  // "/file" has the root as parent, which always exists.
  if (slash == 0) return;

  EnsureDirectory(local_path.substr(0, slash));
}

}  // namespace transfer
}  // namespace s3bulk
