/*
 * base/errors.cc
 * -------------------------------------------------------------------------
 * Exceptions raised by transfers.
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

#include "base/errors.h"

#include <string.h>

namespace s3bulk {
namespace base {

namespace {
std::string ErrnoToString(int error_code) {
  char buf[256];
  // GNU strerror_r may return a static string rather than fill |buf|
  return strerror_r(error_code, buf, sizeof(buf));
}
}  // namespace

RemoteError::RemoteError(const std::string &key, const std::string &cause)
    : TransferError("failed to transfer object [" + key + "]: " + cause),
      key_(key),
      cause_(cause) {}

IoError::IoError(const std::string &path, int error_code,
                 const std::string &operation)
    : TransferError("failed to " + operation + " [" + path +
                    "]: " + ErrnoToString(error_code)),
      path_(path),
      error_code_(error_code) {}

}  // namespace base
}  // namespace s3bulk
