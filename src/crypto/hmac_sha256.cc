/*
 * crypto/hmac_sha256.cc
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

#include "crypto/hmac_sha256.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <stdexcept>

namespace s3bulk {
namespace crypto {

constexpr int HmacSha256::MAC_LEN;

void HmacSha256::Sign(const uint8_t *key, size_t key_len, const uint8_t *data,
                      size_t data_len, uint8_t *mac) {
  unsigned int mac_len = 0;

  if (!HMAC(EVP_sha256(), key, static_cast<int>(key_len), data, data_len, mac,
            &mac_len) ||
      mac_len != MAC_LEN)
    throw std::runtime_error("failed to compute hmac-sha256.");
}

}  // namespace crypto
}  // namespace s3bulk
