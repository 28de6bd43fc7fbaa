/*
 * base/request.h
 * -------------------------------------------------------------------------
 * HTTP request.
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

#ifndef S3BULK_BASE_REQUEST_H
#define S3BULK_BASE_REQUEST_H

#include <stdio.h>
#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace s3bulk {
namespace base {
enum class HttpMethod { INVALID, GET, PUT };

enum HttpStatusCode {
  HTTP_SC_OK = 200,
  HTTP_SC_MULTIPLE_CHOICES = 300,
  HTTP_SC_BAD_REQUEST = 400,
  HTTP_SC_UNAUTHORIZED = 401,
  HTTP_SC_FORBIDDEN = 403,
  HTTP_SC_NOT_FOUND = 404,
  HTTP_SC_PRECONDITION_FAILED = 412,
  HTTP_SC_INTERNAL_SERVER_ERROR = 500,
  HTTP_SC_SERVICE_UNAVAILABLE = 503
};

const char *HttpMethodToString(HttpMethod method);

class Request;
class RequestHook;
class Transport;

class RequestFactory {
 public:
  // |hook| must outlive the request.
  static std::unique_ptr<Request> New(RequestHook *hook);
  static std::unique_ptr<Request> NewNoHook();
};

using HeaderMap = std::map<std::string, std::string>;

class Request {
 public:
  // Receives response body chunks for 2xx responses. Returns 0, or a negative
  // errno value to abort the transfer.
  using OutputSink = std::function<int(const char *, size_t)>;

  // Fills the buffer with up to |size| bytes of request body. Returns the
  // number of bytes written, or a negative errno value to abort.
  using InputSource = std::function<ssize_t(char *, size_t)>;

  ~Request();

  void Init(HttpMethod method);

  inline HttpMethod method() const { return method_; }
  inline std::string url() const { return url_; }
  inline const HeaderMap &headers() const { return headers_; }
  inline int response_code() const { return response_code_; }

  // Error returned by the output sink or input source during the last Run(),
  // or 0.
  inline int callback_error() const { return callback_error_; }

  // Response body of a non-2xx response.
  std::string GetOutputAsString() const;

  void SetUrl(const std::string &url);
  void SetHeader(const std::string &name, const std::string &value);

  void SetOutputSink(OutputSink sink);
  void SetInputSource(uint64_t size, InputSource source);

  // |timeout_in_s| bounds the time without progress, |connect_timeout_in_s|
  // the time to connect. Both must be positive (std::invalid_argument).
  //
  // Throws std::runtime_error on transport failure. An abort requested by the
  // sink or source is not a transport failure: Run() returns normally and
  // callback_error() is set.
  void Run(int timeout_in_s, int connect_timeout_in_s);

 private:
  friend class RequestFactory;  // for ctor.

  static size_t WriteOutputWrapper(char *data, size_t size, size_t items,
                                   void *context) {
    return static_cast<Request *>(context)->WriteOutput(data, size, items);
  }

  static size_t ReadInputWrapper(char *data, size_t size, size_t items,
                                 void *context) {
    return static_cast<Request *>(context)->ReadInput(data, size, items);
  }

  static int SeekInputWrapper(void *context, off_t offset, int origin) {
    return static_cast<Request *>(context)->SeekInput(offset, origin);
  }

  static int ProgressWrapper(void *context, off_t dl_total, off_t dl_now,
                             off_t ul_total, off_t ul_now) {
    return static_cast<Request *>(context)->Progress(dl_total, dl_now, ul_total,
                                                     ul_now);
  }

  explicit Request(RequestHook *hook);

  size_t WriteOutput(char *data, size_t size, size_t items);
  size_t ReadInput(char *data, size_t size, size_t items);
  int SeekInput(off_t offset, int origin);
  int Progress(off_t dl_total, off_t dl_now, off_t ul_total, off_t ul_now);

  bool IsSuccessResponse() const;

  // not reset by Init()
  const std::unique_ptr<Transport> transport_;
  RequestHook *const hook_ = nullptr;

  // should be reset by Init()
  static constexpr int ERROR_MESSAGE_BUFFER_LEN = 256;
  char transport_error_[ERROR_MESSAGE_BUFFER_LEN];

  HttpMethod method_ = HttpMethod::INVALID;
  std::string url_;

  std::vector<char> output_buffer_;
  OutputSink output_sink_;

  int response_code_ = 0;

  // assumptions: no duplicates, all header names are always lower-case
  HeaderMap headers_;

  InputSource input_source_;
  uint64_t input_source_size_ = 0;

  // reset by Run()
  int callback_error_ = 0;
  uint64_t bytes_streamed_ = 0;
  int timeout_in_s_ = 0;
  time_t deadline_ = 0;
  off_t last_progress_ = 0;
};
}  // namespace base
}  // namespace s3bulk

#endif
