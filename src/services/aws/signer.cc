/*
 * services/aws/signer.cc
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

#include "services/aws/signer.h"

#include <ctype.h>

#include <algorithm>
#include <map>
#include <sstream>
#include <stdexcept>

#include "base/logger.h"
#include "base/request.h"
#include "base/timer.h"
#include "base/url.h"
#include "crypto/hash.h"
#include "crypto/hex.h"
#include "crypto/hmac_sha256.h"
#include "crypto/sha256.h"
#include "services/utils.h"

namespace s3bulk {
namespace services {
namespace aws {

constexpr char Signer::ALGORITHM[];
constexpr char Signer::SERVICE_NAME[];
constexpr char Signer::UNSIGNED_PAYLOAD[];

namespace {
constexpr char DATE_FORMAT[] = "%Y%m%d";
constexpr char TIMESTAMP_FORMAT[] = "%Y%m%dT%H%M%SZ";
constexpr char TERMINATOR[] = "aws4_request";

constexpr char HEADER_AUTHORIZATION[] = "authorization";
constexpr char HEADER_CONTENT_SHA256[] = "x-amz-content-sha256";
constexpr char HEADER_DATE[] = "x-amz-date";
constexpr char HEADER_SECURITY_TOKEN[] = "x-amz-security-token";

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return tolower(c); });
  return s;
}

std::string Trim(const std::string &s) {
  const auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

std::string CanonicalQuery(const std::string &query) {
  std::vector<std::string> params;
  std::istringstream stream(query);
  std::string param;

  while (std::getline(stream, param, '&')) {
    if (param.empty()) continue;
    if (param.find('=') == std::string::npos) param += "=";
    params.push_back(param);
  }

  std::sort(params.begin(), params.end());

  std::string canonical;
  for (const auto &p : params) {
    if (!canonical.empty()) canonical += "&";
    canonical += p;
  }
  return canonical;
}
}  // namespace

std::vector<uint8_t> Signer::DeriveSigningKey(const std::string &secret,
                                              const std::string &date,
                                              const std::string &region,
                                              const std::string &service) {
  const std::string initial = std::string("AWS4") + secret;
  std::vector<uint8_t> key(initial.begin(), initial.end());

  key = crypto::HmacSha256::Sign(key, date);
  key = crypto::HmacSha256::Sign(key, region);
  key = crypto::HmacSha256::Sign(key, service);
  return crypto::HmacSha256::Sign(key, TERMINATOR);
}

Signer::Signer(const Credentials &credentials, const std::string &region)
    : credentials_(credentials), region_(region) {
  if (credentials_.key_id.empty() || credentials_.secret.empty())
    throw std::runtime_error("AWS credentials are incomplete.");
  if (region_.empty()) throw std::runtime_error("AWS region is not set.");
}

void Signer::PreRun(base::Request *req) { Sign(req, time(nullptr)); }

std::string Signer::BuildCanonicalRequest(const base::Request &req,
                                          std::string *signed_headers) {
  std::string host, path, query;

  if (!base::Url::Split(req.url(), &host, &path, &query))
    throw std::runtime_error("cannot sign request without absolute url.");

  std::map<std::string, std::string> headers;
  headers["host"] = host;
  for (const auto &header : req.headers()) {
    const std::string name = ToLower(header.first);
    if (name == HEADER_AUTHORIZATION) continue;
    headers[name] = Trim(header.second);
  }

  std::string canonical_headers;
  signed_headers->clear();
  for (const auto &header : headers) {
    canonical_headers += header.first + ":" + header.second + "\n";
    if (!signed_headers->empty()) *signed_headers += ";";
    *signed_headers += header.first;
  }

  return std::string(base::HttpMethodToString(req.method())) + "\n" + path +
         "\n" + CanonicalQuery(query) + "\n" + canonical_headers + "\n" +
         *signed_headers + "\n" +
         FindOrDefault(req.headers(), HEADER_CONTENT_SHA256);
}

void Signer::Sign(base::Request *req, time_t now) const {
  const std::string date = base::Timer::GetUtcTime(DATE_FORMAT, now);
  const std::string timestamp = base::Timer::GetUtcTime(TIMESTAMP_FORMAT, now);

  req->SetHeader(HEADER_DATE, timestamp);
  req->SetHeader(HEADER_CONTENT_SHA256, UNSIGNED_PAYLOAD);
  if (!credentials_.session_token.empty())
    req->SetHeader(HEADER_SECURITY_TOKEN, credentials_.session_token);

  std::string signed_headers;
  const std::string canonical_request =
      BuildCanonicalRequest(*req, &signed_headers);
  const std::string scope =
      date + "/" + region_ + "/" + SERVICE_NAME + "/" + TERMINATOR;
  const std::string to_sign =
      std::string(ALGORITHM) + "\n" + timestamp + "\n" + scope + "\n" +
      crypto::Hash::Compute<crypto::Sha256, crypto::Hex>(canonical_request);

  S3BULK_LOG(LOG_DEBUG, "Signer::Sign", "canonical request:\n%s\n",
             canonical_request.c_str());

  const auto signing_key =
      DeriveSigningKey(credentials_.secret, date, region_, SERVICE_NAME);
  const auto signature = crypto::HmacSha256::Sign(signing_key, to_sign);

  req->SetHeader("Authorization", std::string(ALGORITHM) + " Credential=" +
                                      credentials_.key_id + "/" + scope +
                                      ", SignedHeaders=" + signed_headers +
                                      ", Signature=" +
                                      crypto::Hex::Encode(signature));
}

}  // namespace aws
}  // namespace services
}  // namespace s3bulk
