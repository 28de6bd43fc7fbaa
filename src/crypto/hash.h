/*
 * crypto/hash.h
 * -------------------------------------------------------------------------
 * Hash computation helpers.
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

#ifndef S3BULK_CRYPTO_HASH_H
#define S3BULK_CRYPTO_HASH_H

#include <stdint.h>

#include <string>

namespace s3bulk {
namespace crypto {
class Hash {
 public:
  template <class HashType>
  inline static void Compute(const std::string &input, uint8_t *hash) {
    HashType::Compute(reinterpret_cast<const uint8_t *>(input.data()),
                      input.size(), hash);
  }

  template <class HashType, class EncoderType>
  inline static std::string Compute(const std::string &input) {
    uint8_t hash[HashType::HASH_LEN];
    Compute<HashType>(input, hash);
    return EncoderType::Encode(hash, HashType::HASH_LEN);
  }
};
}  // namespace crypto
}  // namespace s3bulk

#endif
