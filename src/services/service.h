/*
 * services/service.h
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

#ifndef S3BULK_SERVICES_SERVICE_H
#define S3BULK_SERVICES_SERVICE_H

#include <memory>
#include <string>

#include "services/object_store.h"

namespace s3bulk {
namespace services {
class Service {
 public:
  // Uses whatever service is defined in the config file.
  static std::shared_ptr<const ObjectStore> Create();

  static std::string GetEnabledServices();
};
}  // namespace services
}  // namespace s3bulk

#endif
