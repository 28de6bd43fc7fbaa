/*
 * base/errors.h
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

#ifndef S3BULK_BASE_ERRORS_H
#define S3BULK_BASE_ERRORS_H

#include <stdexcept>
#include <string>

namespace s3bulk {
namespace base {
class TransferError : public std::runtime_error {
 public:
  explicit TransferError(const std::string &what) : std::runtime_error(what) {}
};

// Store-side failure (not found, auth, throttling, network) for one object.
class RemoteError : public TransferError {
 public:
  RemoteError(const std::string &key, const std::string &cause);

  inline const std::string &key() const { return key_; }
  inline const std::string &cause() const { return cause_; }

 private:
  std::string key_, cause_;
};

// Local filesystem failure. |error_code| is a positive errno value.
class IoError : public TransferError {
 public:
  IoError(const std::string &path, int error_code,
          const std::string &operation);

  inline const std::string &path() const { return path_; }
  inline int error_code() const { return error_code_; }

 private:
  std::string path_;
  int error_code_;
};

// Failure that prevents a whole batch from starting.
class BatchSetupError : public TransferError {
 public:
  explicit BatchSetupError(const std::string &what) : TransferError(what) {}
};
}  // namespace base
}  // namespace s3bulk

#endif
