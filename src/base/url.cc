/*
 * base/url.cc
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

#include "base/url.h"

#include <ctype.h>

#include <algorithm>
#include <cstdint>
#include <string>

namespace s3bulk {
namespace base {

std::string Url::Encode(const std::string &url) {
  constexpr char HEX[] = "0123456789ABCDEF";

  std::string ret;
  ret.reserve(url.length());

  for (size_t i = 0; i < url.length(); i++) {
    const auto c = static_cast<uint8_t>(url[i]);

    // signature v4 wants exactly this set left alone
    if (c == '/' || c == '.' || c == '-' || c == '_' || c == '~' ||
        isalnum(c)) {
      ret += url[i];
    } else {
      ret += '%';
      ret += HEX[c / 16];
      ret += HEX[c % 16];
    }
  }

  return ret;
}

bool Url::Split(const std::string &url, std::string *host, std::string *path,
                std::string *query) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == std::string::npos) return false;

  const size_t host_begin = scheme_end + 3;
  const size_t path_begin = url.find('/', host_begin);
  const size_t query_begin = url.find('?', host_begin);

  const size_t host_end = std::min(path_begin, query_begin);
  *host = url.substr(host_begin, host_end == std::string::npos
                                     ? std::string::npos
                                     : host_end - host_begin);

  if (path_begin == std::string::npos || path_begin > query_begin)
    *path = "/";
  else
    *path = url.substr(path_begin, query_begin == std::string::npos
                                       ? std::string::npos
                                       : query_begin - path_begin);

  *query = (query_begin == std::string::npos) ? ""
                                              : url.substr(query_begin + 1);
  return true;
}

}  // namespace base
}  // namespace s3bulk
