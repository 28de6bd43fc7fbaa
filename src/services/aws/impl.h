/*
 * services/aws/impl.h
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

#ifndef S3BULK_SERVICES_AWS_IMPL_H
#define S3BULK_SERVICES_AWS_IMPL_H

#include <memory>
#include <string>

#include "base/request.h"
#include "services/aws/signer.h"
#include "services/object_store.h"

namespace s3bulk {
namespace base {
class Request;
}

namespace services {
namespace aws {
class Impl : public services::ObjectStore {
 public:
  struct Options {
    std::string region;
    // Empty selects the regional AWS endpoint.
    std::string endpoint;
    bool use_ssl = true;
    bool virtual_host_style = false;
    int connect_timeout_in_s = 30;
    // Time a request may go without moving any bytes.
    int transfer_timeout_in_s = 300;
  };

  static Options OptionsFromConfig();

  // Reads "<key id> <secret> [<session token>]" from aws_secret_file if set,
  // and falls back to AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and
  // AWS_SESSION_TOKEN otherwise.
  static Credentials LoadCredentials();

  Impl(const Options &options, const Credentials &credentials);
  ~Impl() override = default;

  // BEGIN services::ObjectStore
  int Get(const std::string &bucket, const std::string &key,
          ObjectSink *sink) const override;
  int Put(const std::string &bucket, const std::string &key,
          ObjectSource *source) const override;
  // END services::ObjectStore

  std::string BuildUrl(const std::string &bucket, const std::string &key) const;

 private:
  void RunRequest(base::Request *req, const std::string &key) const;

  Options options_;
  std::string scheme_, host_;
  std::unique_ptr<Signer> signer_;
};
}  // namespace aws
}  // namespace services
}  // namespace s3bulk

#endif
