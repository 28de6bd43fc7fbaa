/*
 * base/url.h
 * -------------------------------------------------------------------------
 * URL encoding and splitting.
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

#ifndef S3BULK_BASE_URL_H
#define S3BULK_BASE_URL_H

#include <string>

namespace s3bulk {
namespace base {
class Url {
 public:
  // Percent-encodes everything except unreserved characters and "/".
  static std::string Encode(const std::string &url);

  // Splits "scheme://host[:port]/path?query". Returns false if |url| has no
  // scheme.
  static bool Split(const std::string &url, std::string *host,
                    std::string *path, std::string *query);
};
}  // namespace base
}  // namespace s3bulk

#endif
