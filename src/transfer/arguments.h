/*
 * transfer/arguments.h
 * -------------------------------------------------------------------------
 * Parsing of paired command-line arguments.
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

#ifndef S3BULK_TRANSFER_ARGUMENTS_H
#define S3BULK_TRANSFER_ARGUMENTS_H

#include <string>
#include <vector>

#include "transfer/transfer_outcome.h"
#include "transfer/uploader.h"

namespace s3bulk {
namespace transfer {
// Object keys may contain '=' (e.g. "year=2024/part.txt"), local paths may
// not. Each pair is therefore split on the '=' closest to the path.
class Arguments {
 public:
  // "<key>=<local path>", split on the last '='.
  static std::vector<TransferDescriptor> ParseDownloads(
      const std::vector<std::string> &args);

  // "<local path>=<key>", split on the first '='.
  static std::vector<Uploader::Upload> ParseUploads(
      const std::vector<std::string> &args);
};
}  // namespace transfer
}  // namespace s3bulk

#endif
