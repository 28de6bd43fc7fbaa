/*
 * base/request_hook.h
 * -------------------------------------------------------------------------
 * Hook for service-specific request processing.
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

#ifndef S3BULK_BASE_REQUEST_HOOK_H
#define S3BULK_BASE_REQUEST_HOOK_H

namespace s3bulk {
namespace base {
class Request;

class RequestHook {
 public:
  virtual ~RequestHook() = default;

  // Called once all headers are set, immediately before the request goes out.
  virtual void PreRun(Request *req) = 0;
};
}  // namespace base
}  // namespace s3bulk

#endif
