/*
 * base/paths.h
 * -------------------------------------------------------------------------
 * Path transformation helpers.
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

#ifndef S3BULK_BASE_PATHS_H
#define S3BULK_BASE_PATHS_H

#include <string>

namespace s3bulk {
namespace base {
class Paths {
 public:
  // Expands a leading "~" to $HOME.
  static std::string Transform(const std::string &path);
};
}  // namespace base
}  // namespace s3bulk

#endif
