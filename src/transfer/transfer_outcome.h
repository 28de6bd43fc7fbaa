/*
 * transfer/transfer_outcome.h
 * -------------------------------------------------------------------------
 * Per-item transfer descriptors and outcomes.
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

#ifndef S3BULK_TRANSFER_TRANSFER_OUTCOME_H
#define S3BULK_TRANSFER_TRANSFER_OUTCOME_H

#include <stdexcept>
#include <string>

namespace s3bulk {
namespace transfer {
struct TransferDescriptor {
  std::string object_key;
  std::string local_path;
};

struct FailedTransfer {
  std::string key;
  std::string message;
};

// Either a success carrying the resulting path, or a failure carrying the
// object key and an error message.
class TransferOutcome {
 public:
  inline static TransferOutcome Success(const std::string &path) {
    return TransferOutcome(true, path, "");
  }

  inline static TransferOutcome Failure(const std::string &key,
                                        const std::string &message) {
    return TransferOutcome(false, key, message);
  }

  inline bool succeeded() const { return succeeded_; }

  inline const std::string &path() const {
    if (!succeeded_)
      throw std::logic_error("path() called on failed transfer outcome.");
    return subject_;
  }

  inline const std::string &key() const {
    if (succeeded_)
      throw std::logic_error("key() called on successful transfer outcome.");
    return subject_;
  }

  inline const std::string &message() const {
    if (succeeded_)
      throw std::logic_error(
          "message() called on successful transfer outcome.");
    return message_;
  }

 private:
  inline TransferOutcome(bool succeeded, const std::string &subject,
                         const std::string &message)
      : succeeded_(succeeded), subject_(subject), message_(message) {}

  bool succeeded_;
  std::string subject_;  // path on success, key on failure
  std::string message_;
};
}  // namespace transfer
}  // namespace s3bulk

#endif
