/*
 * crypto/sha256.cc
 * -------------------------------------------------------------------------
 * SHA256 hash.
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

#include "crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace s3bulk {
namespace crypto {

constexpr int Sha256::HASH_LEN;

void Sha256::Compute(const uint8_t *input, size_t size, uint8_t *hash) {
  if (!EVP_Digest(input, size, hash, nullptr, EVP_sha256(), nullptr))
    throw std::runtime_error("failed to compute sha256.");
}

}  // namespace crypto
}  // namespace s3bulk
