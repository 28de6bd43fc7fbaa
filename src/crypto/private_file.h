/*
 * crypto/private_file.h
 * -------------------------------------------------------------------------
 * Access to files readable only by their owner.
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

#ifndef S3BULK_CRYPTO_PRIVATE_FILE_H
#define S3BULK_CRYPTO_PRIVATE_FILE_H

#include <fstream>
#include <string>

namespace s3bulk {
namespace crypto {
class PrivateFile {
 public:
  // Throws unless |file| exists and grants no access beyond its owner.
  static void Open(const std::string &file, std::ifstream *f);
};
}  // namespace crypto
}  // namespace s3bulk

#endif
