/*
 * services/utils.cc
 * -------------------------------------------------------------------------
 * Utility functions for service implementations.
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

#include "services/utils.h"

#include <atomic>

#include "base/request.h"
#include "base/statistics.h"
#include "base/xml.h"

namespace s3bulk {
namespace services {

namespace {
constexpr char ERROR_CODE_XPATH[] = "/Error/Code";
constexpr char ERROR_MESSAGE_XPATH[] = "/Error/Message";

std::atomic_int s_not_found(0), s_access_denied(0), s_throttled(0);
std::atomic_int s_server_errors(0), s_other_errors(0);

void StatsWriter(std::ostream *o) {
  *o << "service errors:\n"
        "  not found: "
     << s_not_found
     << "\n"
        "  access denied: "
     << s_access_denied
     << "\n"
        "  throttled: "
     << s_throttled
     << "\n"
        "  server errors: "
     << s_server_errors
     << "\n"
        "  other: "
     << s_other_errors << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);

const char *DefaultCodeForStatus(int status) {
  switch (status) {
    case base::HTTP_SC_BAD_REQUEST:
      return "BadRequest";
    case base::HTTP_SC_UNAUTHORIZED:
    case base::HTTP_SC_FORBIDDEN:
      return "AccessDenied";
    case base::HTTP_SC_NOT_FOUND:
      return "NoSuchKey";
    case base::HTTP_SC_PRECONDITION_FAILED:
      return "PreconditionFailed";
    case base::HTTP_SC_INTERNAL_SERVER_ERROR:
      return "InternalError";
    case base::HTTP_SC_SERVICE_UNAVAILABLE:
      return "ServiceUnavailable";
  }
  return "UnexpectedResponse";
}

void CountError(int status) {
  if (status == base::HTTP_SC_NOT_FOUND)
    ++s_not_found;
  else if (status == base::HTTP_SC_UNAUTHORIZED ||
           status == base::HTTP_SC_FORBIDDEN)
    ++s_access_denied;
  else if (status == base::HTTP_SC_SERVICE_UNAVAILABLE)
    ++s_throttled;
  else if (status >= base::HTTP_SC_INTERNAL_SERVER_ERROR)
    ++s_server_errors;
  else
    ++s_other_errors;
}
}  // namespace

std::string DescribeErrorResponse(int status, const std::string &body) {
  std::string code, message;

  CountError(status);

  if (!body.empty()) {
    auto xml = base::XmlDocument::Parse(body);
    if (xml) {
      if (xml->Find(ERROR_CODE_XPATH, &code)) code.clear();
      if (xml->Find(ERROR_MESSAGE_XPATH, &message)) message.clear();
    }
  }

  if (code.empty()) code = DefaultCodeForStatus(status);

  std::string description = code;
  if (!message.empty()) description += ": " + message;
  description += " (HTTP " + std::to_string(status) + ")";
  return description;
}

}  // namespace services
}  // namespace s3bulk
