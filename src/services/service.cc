/*
 * services/service.cc
 * -------------------------------------------------------------------------
 * Selects and constructs the configured object store.
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

#include "services/service.h"

#include <memory>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "services/aws/impl.h"

namespace s3bulk {
namespace services {
std::shared_ptr<const ObjectStore> Service::Create() {
  if (base::Config::service() == "aws")
    return std::make_shared<aws::Impl>(aws::Impl::OptionsFromConfig(),
                                       aws::Impl::LoadCredentials());

  S3BULK_LOG(LOG_ERR, "Service::Create", "unknown service [%s].\n",
             base::Config::service().c_str());
  throw std::runtime_error("invalid service specified.");
}

std::string Service::GetEnabledServices() { return "aws"; }
}  // namespace services
}  // namespace s3bulk
