/*
 * crypto/hmac_sha256.h
 * -------------------------------------------------------------------------
 * HMAC-SHA256 signing.
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

#ifndef S3BULK_CRYPTO_HMAC_SHA256_H
#define S3BULK_CRYPTO_HMAC_SHA256_H

#include <cstdint>
#include <string>
#include <vector>

namespace s3bulk {
namespace crypto {
class HmacSha256 {
 public:
  static constexpr int MAC_LEN = 256 / 8;

  static void Sign(const uint8_t *key, size_t key_len, const uint8_t *data,
                   size_t data_len, uint8_t *mac);

  inline static void Sign(const std::string &key, const std::string &data,
                          uint8_t *mac) {
    Sign(reinterpret_cast<const uint8_t *>(key.data()), key.size(),
         reinterpret_cast<const uint8_t *>(data.data()), data.size(), mac);
  }

  // For key chaining, where each MAC is the key of the next round.
  inline static std::vector<uint8_t> Sign(const std::vector<uint8_t> &key,
                                          const std::string &data) {
    std::vector<uint8_t> mac(MAC_LEN);
    Sign(key.data(), key.size(),
         reinterpret_cast<const uint8_t *>(data.data()), data.size(),
         mac.data());
    return mac;
  }
};
}  // namespace crypto
}  // namespace s3bulk

#endif
