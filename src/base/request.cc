/*
 * base/request.cc
 * -------------------------------------------------------------------------
 * Executes HTTP requests using libcurl.
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

#include "base/request.h"

#include <curl/curl.h>
#include <string.h>
#include <time.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <stdexcept>

#include "base/config.h"
#include "base/logger.h"
#include "base/request_hook.h"
#include "base/statistics.h"
#include "base/timer.h"

#define TEST_OK(x)                                                           \
  do {                                                                       \
    if ((x) != CURLE_OK) throw std::runtime_error("call to " #x " failed."); \
  } while (0)

namespace s3bulk {
namespace base {

namespace {
constexpr char USER_AGENT[] = PACKAGE_NAME " " PACKAGE_VERSION_WITH_REV;

uint64_t s_run_count = 0;
uint64_t s_total_bytes = 0;
double s_run_time = 0.0;

std::atomic_int s_curl_failures(0), s_request_failures(0);
std::atomic_int s_timeouts(0), s_callback_aborts(0);
std::mutex s_stats_mutex;

class HttpMethodCounters {
 public:
  HttpMethodCounters() = default;

  void Increment(HttpMethod method) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++counters_[method];
  }

  void Write(std::ostream *o) {
    std::lock_guard<std::mutex> lock(mutex_);

    *o << "http request methods:\n";
    for (const auto &kv : counters_) {
      *o << "  " << HttpMethodToString(kv.first) << ": " << kv.second << "\n";
    }
  }

 private:
  std::map<HttpMethod, int> counters_;
  std::mutex mutex_;
};

HttpMethodCounters *GetHttpMethodCounters() {
  static auto *counters = new HttpMethodCounters();
  return counters;
}

void StatsWriter(std::ostream *o) {
  std::lock_guard<std::mutex> lock(s_stats_mutex);
  o->setf(std::ostream::fixed);

  *o << "http requests:\n"
        "  count: "
     << s_run_count
     << "\n"
        "  total time: "
     << std::setprecision(2) << s_run_time
     << " s\n"
        "  bytes: "
     << s_total_bytes
     << "\n"
        "  throughput: "
     << (s_run_time > 0.0
             ? static_cast<double>(s_total_bytes) / s_run_time * 1.0e-3
             : 0.0)
     << " kB/s\n"
        "  curl failures: "
     << s_curl_failures
     << "\n"
        "  request failures: "
     << s_request_failures
     << "\n"
        "  timeouts: "
     << s_timeouts
     << "\n"
        "  aborted by sink or source: "
     << s_callback_aborts << "\n";

  GetHttpMethodCounters()->Write(o);
}

Statistics::Writers::Entry s_writer(StatsWriter, 0);
}  // namespace

class CurlSListWrapper {
 public:
  CurlSListWrapper() = default;
  ~CurlSListWrapper() {
    if (list_) curl_slist_free_all(list_);
  }

  inline void Append(const std::string &item) {
    list_ = curl_slist_append(list_, item.c_str());
  }

  inline const curl_slist *get() const { return list_; }

 private:
  curl_slist *list_ = nullptr;
};

class Transport {
 public:
  Transport() {
    {
      std::lock_guard<std::mutex> lock(s_mutex);
      if (s_refcount == 0) {
        if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK)
          throw std::runtime_error("curl_global_init() failed.");
        auto *ver = curl_version_info(CURLVERSION_NOW);
        if (!ver) throw std::runtime_error("curl_version_info() failed.");
        S3BULK_LOG(LOG_DEBUG, "Transport::Transport", "ssl version: %s\n",
                   ver->ssl_version ? ver->ssl_version : "(none)");
        if (!ver->ssl_version)
          S3BULK_LOG(LOG_WARNING, "Transport::Transport",
                     "curl does not report an SSL library. only http "
                     "endpoints will work.\n");
      }
      ++s_refcount;
    }

    curl_ = curl_easy_init();
    if (!curl_) throw std::runtime_error("curl_easy_init() failed.");
  }

  ~Transport() {
    curl_easy_cleanup(curl_);

    {
      std::lock_guard<std::mutex> lock(s_mutex);
      --s_refcount;
      if (s_refcount == 0) {
        curl_global_cleanup();
      }
    }
  }

  inline CURL *curl() const { return curl_; }

 private:
  static std::mutex s_mutex;
  static int s_refcount;

  CURL *curl_ = nullptr;
};

std::mutex Transport::s_mutex;
int Transport::s_refcount = 0;

const char *HttpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::INVALID:
      return "INVALID";
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::PUT:
      return "PUT";
  }
  throw std::runtime_error("invalid HTTP method.");
}

std::unique_ptr<Request> RequestFactory::New(RequestHook *hook) {
  return std::unique_ptr<Request>(new Request(hook));
}

std::unique_ptr<Request> RequestFactory::NewNoHook() {
  return std::unique_ptr<Request>(new Request(nullptr));
}

Request::Request(RequestHook *hook) : transport_(new Transport()), hook_(hook) {
  // stuff that's set in the ctor shouldn't be modified elsewhere, since the
  // call to Init() won't reset it

  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_VERBOSE,
                           Config::verbose_requests() ? 1L : 0L));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_NOPROGRESS, 0L));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_FOLLOWLOCATION, 1L));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_ERRORBUFFER,
                           transport_error_));
  static_assert(sizeof(transport_error_) >= CURL_ERROR_SIZE,
                "error buffer is too small.");
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_NOSIGNAL, 1L));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_WRITEFUNCTION,
                           &Request::WriteOutputWrapper));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_WRITEDATA, this));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_READFUNCTION,
                           &Request::ReadInputWrapper));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_READDATA, this));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_SEEKFUNCTION,
                           &Request::SeekInputWrapper));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_SEEKDATA, this));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_XFERINFOFUNCTION,
                           &Request::ProgressWrapper));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_XFERINFODATA, this));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_USERAGENT, USER_AGENT));

  transport_error_[0] = '\0';
}

Request::~Request() = default;

void Request::Init(HttpMethod method) {
  url_.clear();
  output_buffer_.clear();
  output_sink_ = nullptr;
  response_code_ = 0;
  headers_.clear();
  input_source_ = nullptr;
  input_source_size_ = 0;

  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_UPLOAD, 0L));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_HTTPGET, 1L));

  if (method == HttpMethod::PUT)
    TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_UPLOAD, 1L));

  method_ = method;
}

std::string Request::GetOutputAsString() const {
  if (output_buffer_.empty()) return "";
  // we do this because output_buffer_ has no trailing null
  std::string s;
  s.assign(&output_buffer_[0], output_buffer_.size());
  return s;
}

void Request::SetUrl(const std::string &url) { url_ = url; }

void Request::SetHeader(const std::string &name, const std::string &value) {
  headers_[name] = value;
}

void Request::SetOutputSink(OutputSink sink) { output_sink_ = std::move(sink); }

void Request::SetInputSource(uint64_t size, InputSource source) {
  input_source_size_ = size;
  input_source_ = std::move(source);
}

void Request::Run(int timeout_in_s, int connect_timeout_in_s) {
  // sanity
  if (method_ == HttpMethod::INVALID)
    throw std::runtime_error("call Init() first!");
  if (url_.empty()) throw std::runtime_error("call SetUrl() first!");
  if (timeout_in_s <= 0 || connect_timeout_in_s <= 0)
    throw std::invalid_argument("request timeouts must be positive.");

  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_URL, url_.c_str()));
  TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_CONNECTTIMEOUT,
                           static_cast<long>(connect_timeout_in_s)));

  if (method_ == HttpMethod::PUT)
    TEST_OK(curl_easy_setopt(transport_->curl(), CURLOPT_INFILESIZE_LARGE,
                             static_cast<curl_off_t>(input_source_size_)));
  else if (input_source_)
    throw std::runtime_error("can't set input data for non-PUT request.");

  if (hook_) hook_->PreRun(this);

  CurlSListWrapper headers;
  uint64_t request_size = 0;
  for (const auto &pair : headers_) {
    std::string header = pair.first + ": " + pair.second;
    headers.Append(header);
    request_size += header.size();
  }
  // libcurl would otherwise send "Expect: 100-continue" for large uploads
  if (method_ == HttpMethod::PUT) headers.Append("Expect:");
  TEST_OK(
      curl_easy_setopt(transport_->curl(), CURLOPT_HTTPHEADER, headers.get()));

  transport_error_[0] = '\0';
  output_buffer_.clear();
  response_code_ = 0;
  callback_error_ = 0;
  bytes_streamed_ = 0;
  last_progress_ = 0;

  timeout_in_s_ = timeout_in_s;
  deadline_ = time(nullptr) + timeout_in_s_;

  GetHttpMethodCounters()->Increment(method_);

  const double start_time = Timer::GetCurrentTime();
  const CURLcode r = curl_easy_perform(transport_->curl());
  const double run_time = Timer::GetCurrentTime() - start_time;

  long response_code = 0;
  if (curl_easy_getinfo(transport_->curl(), CURLINFO_RESPONSE_CODE,
                        &response_code) == CURLE_OK)
    response_code_ = static_cast<int>(response_code);

  {
    std::lock_guard<std::mutex> lock(s_stats_mutex);
    s_run_count++;
    s_run_time += run_time;
    s_total_bytes += request_size + output_buffer_.size() + bytes_streamed_;
  }

  if (callback_error_ != 0 &&
      (r == CURLE_WRITE_ERROR || r == CURLE_ABORTED_BY_CALLBACK)) {
    ++s_callback_aborts;
    S3BULK_LOG(LOG_DEBUG, "Request::Run",
               "[%s] [%s] aborted by sink or source with error %i.\n",
               HttpMethodToString(method_), url_.c_str(), callback_error_);
    return;
  }

  if (r == CURLE_ABORTED_BY_CALLBACK) {
    ++s_timeouts;
    S3BULK_LOG(LOG_WARNING, "Request::Run", "timed out for [%s].\n",
               url_.c_str());
    throw std::runtime_error("timed out after " +
                             std::to_string(timeout_in_s_) +
                             " s without progress");
  }

  if (r != CURLE_OK) {
    ++s_curl_failures;
    const std::string error = std::string(curl_easy_strerror(r)) +
                              (transport_error_[0] ? ": " : "") +
                              transport_error_;
    S3BULK_LOG(LOG_WARNING, "Request::Run", "[%s] [%s] failed: %s\n",
               HttpMethodToString(method_), url_.c_str(), error.c_str());
    throw std::runtime_error(error);
  }

  if (response_code_ >= HTTP_SC_BAD_REQUEST) {
    ++s_request_failures;
    S3BULK_LOG(LOG_DEBUG, "Request::Run",
               "request for [%s] [%s] failed with code %i and response: %s\n",
               HttpMethodToString(method_), url_.c_str(), response_code_,
               GetOutputAsString().c_str());
  }
}

size_t Request::WriteOutput(char *data, size_t size, size_t items) {
  // why even bother with "items"?
  size *= items;

  if (output_sink_ && IsSuccessResponse()) {
    const int r = output_sink_(data, size);
    if (r) {
      callback_error_ = r;
      return 0;  // anything other than |size| aborts the transfer
    }

    bytes_streamed_ += size;
    return size;
  }

  size_t old_size = output_buffer_.size();
  output_buffer_.resize(old_size + size);
  memcpy(&output_buffer_[old_size], data, size);

  return size;
}

size_t Request::ReadInput(char *data, size_t size, size_t items) {
  size *= items;

  if (!input_source_) return 0;

  const ssize_t r = input_source_(data, size);
  if (r < 0) {
    callback_error_ = static_cast<int>(r);
    return CURL_READFUNC_ABORT;
  }

  bytes_streamed_ += r;
  return static_cast<size_t>(r);
}

int Request::SeekInput(off_t offset, int origin) {
  S3BULK_LOG(LOG_DEBUG, "Request::SeekInput",
             "seek to [%jd] from [%i] for [%s]\n",
             static_cast<intmax_t>(offset), origin, url_.c_str());

  // streamed bodies are read once
  return CURL_SEEKFUNC_CANTSEEK;
}

int Request::Progress(off_t dl_total, off_t dl_now, off_t ul_total,
                      off_t ul_now) {
  const time_t now = time(nullptr);

  if (dl_now + ul_now != last_progress_) {
    last_progress_ = dl_now + ul_now;
    deadline_ = now + timeout_in_s_;
    return 0;
  }

  if (now > deadline_) {
    S3BULK_LOG(LOG_DEBUG, "Request::Progress", "time out for [%s]\n",
               url_.c_str());
    return 1;
  }

  return 0;
}

bool Request::IsSuccessResponse() const {
  long code = 0;
  if (curl_easy_getinfo(transport_->curl(), CURLINFO_RESPONSE_CODE, &code) !=
      CURLE_OK)
    return false;
  return code >= HTTP_SC_OK && code < HTTP_SC_MULTIPLE_CHOICES;
}

}  // namespace base
}  // namespace s3bulk
