/*
 * services/aws/signer.h
 * -------------------------------------------------------------------------
 * AWS Signature Version 4 request signer.
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

#ifndef S3BULK_SERVICES_AWS_SIGNER_H
#define S3BULK_SERVICES_AWS_SIGNER_H

#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "base/request_hook.h"

namespace s3bulk {
namespace base {
class Request;
}

namespace services {
namespace aws {
struct Credentials {
  std::string key_id;
  std::string secret;
  std::string session_token;
};

class Signer : public base::RequestHook {
 public:
  static constexpr char ALGORITHM[] = "AWS4-HMAC-SHA256";
  static constexpr char SERVICE_NAME[] = "s3";
  static constexpr char UNSIGNED_PAYLOAD[] = "UNSIGNED-PAYLOAD";

  // |date| is YYYYMMDD.
  static std::vector<uint8_t> DeriveSigningKey(const std::string &secret,
                                               const std::string &date,
                                               const std::string &region,
                                               const std::string &service);

  Signer(const Credentials &credentials, const std::string &region);
  ~Signer() override = default;

  // BEGIN base::RequestHook
  void PreRun(base::Request *req) override;
  // END base::RequestHook

  // Adds x-amz-date, x-amz-content-sha256 and Authorization headers, signed
  // as of |now|. Request bodies are never hashed.
  void Sign(base::Request *req, time_t now) const;

  // Returns the canonical request for |req|, given the headers already set
  // on it. |signed_headers| receives the ';'-separated signed header list.
  static std::string BuildCanonicalRequest(const base::Request &req,
                                           std::string *signed_headers);

  inline const std::string &region() const { return region_; }

 private:
  Credentials credentials_;
  std::string region_;
};
}  // namespace aws
}  // namespace services
}  // namespace s3bulk

#endif
