/*
 * transfer/arguments.cc
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

#include "transfer/arguments.h"

#include <stdexcept>
#include <utility>

namespace s3bulk {
namespace transfer {

namespace {
std::pair<std::string, std::string> Split(const std::string &arg, size_t pos) {
  if (pos == std::string::npos || pos == 0 || pos == arg.size() - 1)
    throw std::invalid_argument("expected <a>=<b>, got [" + arg + "].");
  return std::make_pair(arg.substr(0, pos), arg.substr(pos + 1));
}
}  // namespace

std::vector<TransferDescriptor> Arguments::ParseDownloads(
    const std::vector<std::string> &args) {
  std::vector<TransferDescriptor> downloads;

  downloads.reserve(args.size());
  for (const auto &arg : args) {
    const auto pair = Split(arg, arg.rfind('='));
    downloads.push_back({pair.first, pair.second});
  }

  return downloads;
}

std::vector<Uploader::Upload> Arguments::ParseUploads(
    const std::vector<std::string> &args) {
  std::vector<Uploader::Upload> uploads;

  uploads.reserve(args.size());
  for (const auto &arg : args) uploads.push_back(Split(arg, arg.find('=')));

  return uploads;
}

}  // namespace transfer
}  // namespace s3bulk
