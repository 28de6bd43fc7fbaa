#include <errno.h>

#include <stdexcept>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "base/request.h"
#include "base/request_hook.h"

namespace s3bulk {
namespace base {
namespace tests {

namespace {
constexpr int REQUEST_TIMEOUT = 2;
constexpr int CONNECT_TIMEOUT = 2;

class RecordingHook : public RequestHook {
 public:
  void PreRun(Request *req) override {
    ++calls_;
    req->SetHeader("x-test-hook", "called");
  }

  inline int calls() const { return calls_; }

 private:
  int calls_ = 0;
};
}  // namespace

TEST(Request, BadUrl) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("some:bad:url");

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT), std::runtime_error);
}

TEST(Request, RunWithoutInit) {
  auto r = RequestFactory::NewNoHook();

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT), std::runtime_error);
}

TEST(Request, RunWithoutUrl) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  ASSERT_THROW(r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT), std::runtime_error);
}

TEST(Request, NonPositiveTimeouts) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("http://localhost/");

  EXPECT_THROW(r->Run(0, CONNECT_TIMEOUT), std::invalid_argument);
  EXPECT_THROW(r->Run(REQUEST_TIMEOUT, 0), std::invalid_argument);
}

TEST(Request, InputSourceOnGet) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::GET);
  r->SetUrl("http://localhost/");
  r->SetInputSource(4, [](char *, size_t) -> ssize_t { return -EIO; });

  try {
    r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT);
    FAIL() << "expected std::runtime_error";
  } catch (const std::runtime_error &e) {
    EXPECT_THAT(e.what(), ::testing::HasSubstr("non-PUT"));
  }
}

TEST(Request, HookRunsBeforeTransfer) {
  RecordingHook hook;
  auto r = RequestFactory::New(&hook);

  r->Init(HttpMethod::GET);
  r->SetUrl("bogus-scheme://localhost/bucket/key");

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT), std::runtime_error);
  EXPECT_EQ(1, hook.calls());
  EXPECT_EQ("called", r->headers().at("x-test-hook"));
}

TEST(Request, RefusedPutNeverReadsSource) {
  auto r = RequestFactory::NewNoHook();
  int reads = 0;

  r->Init(HttpMethod::PUT);
  r->SetUrl("http://127.0.0.1:1/bucket/key");
  r->SetInputSource(4, [&reads](char *buffer, size_t size) -> ssize_t {
    ++reads;
    return 0;
  });

  ASSERT_THROW(r->Run(REQUEST_TIMEOUT, CONNECT_TIMEOUT), std::runtime_error);
  EXPECT_EQ(0, reads);
  EXPECT_EQ(0, r->callback_error());
}

TEST(Request, InitClearsState) {
  auto r = RequestFactory::NewNoHook();

  r->Init(HttpMethod::PUT);
  r->SetUrl("http://localhost/a");
  r->SetHeader("x-amz-meta-test", "1");

  r->Init(HttpMethod::GET);

  EXPECT_EQ(HttpMethod::GET, r->method());
  EXPECT_TRUE(r->url().empty());
  EXPECT_TRUE(r->headers().empty());
  EXPECT_EQ(0, r->response_code());
  EXPECT_EQ(0, r->callback_error());
  EXPECT_EQ("", r->GetOutputAsString());
}

TEST(Request, MethodNames) {
  EXPECT_STREQ("GET", HttpMethodToString(HttpMethod::GET));
  EXPECT_STREQ("PUT", HttpMethodToString(HttpMethod::PUT));
  EXPECT_STREQ("INVALID", HttpMethodToString(HttpMethod::INVALID));
}

}  // namespace tests
}  // namespace base
}  // namespace s3bulk
