/*
 * services/aws/impl.cc
 * -------------------------------------------------------------------------
 * Object store implementation for Amazon S3 and S3-compatible services.
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

#include "services/aws/impl.h"

#include <stdlib.h>

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include "base/config.h"
#include "base/errors.h"
#include "base/logger.h"
#include "base/paths.h"
#include "base/url.h"
#include "crypto/private_file.h"
#include "services/utils.h"

namespace s3bulk {
namespace services {
namespace aws {

namespace {
constexpr char ENV_KEY_ID[] = "AWS_ACCESS_KEY_ID";
constexpr char ENV_SECRET[] = "AWS_SECRET_ACCESS_KEY";
constexpr char ENV_SESSION_TOKEN[] = "AWS_SESSION_TOKEN";

std::string GetEnv(const char *name) {
  const char *value = getenv(name);
  return value ? value : "";
}

bool IsSuccess(int code) {
  return code >= base::HTTP_SC_OK && code < base::HTTP_SC_MULTIPLE_CHOICES;
}
}  // namespace

Impl::Options Impl::OptionsFromConfig() {
  Options options;

  options.region = base::Config::aws_region();
  options.endpoint = base::Config::aws_service_endpoint();
  options.use_ssl = base::Config::aws_use_ssl();
  options.virtual_host_style = base::Config::aws_virtual_host_style();
  options.connect_timeout_in_s = base::Config::connect_timeout_in_s();
  options.transfer_timeout_in_s = base::Config::transfer_timeout_in_s();

  return options;
}

Credentials Impl::LoadCredentials() {
  Credentials credentials;

  if (!base::Config::aws_secret_file().empty()) {
    std::ifstream f;
    std::string line;

    crypto::PrivateFile::Open(
        base::Paths::Transform(base::Config::aws_secret_file()), &f);
    std::getline(f, line);

    std::istringstream line_stream(line);
    std::vector<std::string> fields{
        std::istream_iterator<std::string>(line_stream),
        std::istream_iterator<std::string>()};

    if (fields.size() != 2 && fields.size() != 3) {
      S3BULK_LOG(LOG_ERR, "Impl::LoadCredentials",
                 "expected 2 or 3 fields for aws_secret_file, found %zu.\n",
                 fields.size());
      throw std::runtime_error("error while parsing auth data for AWS.");
    }

    credentials.key_id = fields[0];
    credentials.secret = fields[1];
    if (fields.size() == 3) credentials.session_token = fields[2];
  } else {
    credentials.key_id = GetEnv(ENV_KEY_ID);
    credentials.secret = GetEnv(ENV_SECRET);
    credentials.session_token = GetEnv(ENV_SESSION_TOKEN);

    if (credentials.key_id.empty() || credentials.secret.empty()) {
      S3BULK_LOG(LOG_ERR, "Impl::LoadCredentials",
                 "no aws_secret_file configured and %s/%s not set.\n",
                 ENV_KEY_ID, ENV_SECRET);
      throw std::runtime_error("no AWS credentials available.");
    }
  }

  return credentials;
}

Impl::Impl(const Options &options, const Credentials &credentials)
    : options_(options) {
  scheme_ = options_.use_ssl ? "https://" : "http://";

  host_ = options_.endpoint;
  if (host_.empty())
    host_ = std::string("s3.") + options_.region + ".amazonaws.com";

  // Endpoints may be given with a scheme, which takes precedence.
  const auto scheme_end = host_.find("://");
  if (scheme_end != std::string::npos) {
    scheme_ = host_.substr(0, scheme_end + 3);
    host_ = host_.substr(scheme_end + 3);
  }
  while (!host_.empty() && host_.back() == '/') host_.pop_back();

  if (host_.empty()) throw std::runtime_error("invalid service endpoint.");
  if (options_.connect_timeout_in_s <= 0 || options_.transfer_timeout_in_s <= 0)
    throw std::runtime_error("request timeouts must be positive.");

  signer_.reset(new Signer(credentials, options_.region));

  S3BULK_LOG(LOG_DEBUG, "Impl::Impl", "using endpoint %s%s in region %s.\n",
             scheme_.c_str(), host_.c_str(), options_.region.c_str());
}

std::string Impl::BuildUrl(const std::string &bucket,
                           const std::string &key) const {
  if (options_.virtual_host_style)
    return scheme_ + base::Url::Encode(bucket) + "." + host_ + "/" +
           base::Url::Encode(key);

  return scheme_ + host_ + "/" + base::Url::Encode(bucket) + "/" +
         base::Url::Encode(key);
}

void Impl::RunRequest(base::Request *req, const std::string &key) const {
  try {
    req->Run(options_.transfer_timeout_in_s, options_.connect_timeout_in_s);
  } catch (const std::runtime_error &e) {
    throw base::RemoteError(key, e.what());
  }
}

int Impl::Get(const std::string &bucket, const std::string &key,
              ObjectSink *sink) const {
  auto req = base::RequestFactory::New(signer_.get());
  bool opened = false;

  req->Init(base::HttpMethod::GET);
  req->SetUrl(BuildUrl(bucket, key));
  req->SetOutputSink([sink, &opened](const char *data, size_t size) {
    if (!opened) {
      int r = sink->Open();
      if (r) return r;
      opened = true;
    }
    return sink->Write(data, size);
  });

  RunRequest(req.get(), key);

  if (req->callback_error()) return req->callback_error();

  if (!IsSuccess(req->response_code()))
    throw base::RemoteError(key,
                            DescribeErrorResponse(req->response_code(),
                                                  req->GetOutputAsString()));

  // Empty objects never reach the sink.
  return opened ? 0 : sink->Open();
}

int Impl::Put(const std::string &bucket, const std::string &key,
              ObjectSource *source) const {
  auto req = base::RequestFactory::New(signer_.get());

  req->Init(base::HttpMethod::PUT);
  req->SetUrl(BuildUrl(bucket, key));
  req->SetHeader("Content-Type", "binary/octet-stream");
  req->SetInputSource(source->size(), [source](char *buffer, size_t size) {
    return source->Read(buffer, size);
  });

  RunRequest(req.get(), key);

  if (req->callback_error()) return req->callback_error();

  if (!IsSuccess(req->response_code()))
    throw base::RemoteError(key,
                            DescribeErrorResponse(req->response_code(),
                                                  req->GetOutputAsString()));

  return 0;
}

}  // namespace aws
}  // namespace services
}  // namespace s3bulk
