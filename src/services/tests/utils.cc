#include <map>
#include <mutex>
#include <string>

#include <gtest/gtest.h>

#include "base/xml.h"
#include "services/utils.h"

namespace s3bulk {
namespace services {
namespace tests {

namespace {
class Utils : public ::testing::Test {
 protected:
  void SetUp() override {
    static std::once_flag flag;
    std::call_once(flag, []() { base::XmlDocument::Init(); });
  }
};
}  // namespace

TEST_F(Utils, FindOrDefault) {
  const std::map<std::string, std::string> headers = {{"a", "1"}, {"b", "2"}};

  EXPECT_EQ("1", FindOrDefault(headers, "a"));
  EXPECT_EQ("", FindOrDefault(headers, "c"));
}

TEST_F(Utils, DescribeS3Error) {
  EXPECT_EQ("NoSuchKey: The specified key does not exist. (HTTP 404)",
            DescribeErrorResponse(
                404,
                "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
                "<Error><Code>NoSuchKey</Code><Message>The specified key does "
                "not exist.</Message><Key>k2</Key></Error>"));
}

TEST_F(Utils, DescribeErrorWithoutBody) {
  EXPECT_EQ("NoSuchKey (HTTP 404)", DescribeErrorResponse(404, ""));
  EXPECT_EQ("AccessDenied (HTTP 403)", DescribeErrorResponse(403, ""));
  EXPECT_EQ("ServiceUnavailable (HTTP 503)", DescribeErrorResponse(503, ""));
  EXPECT_EQ("UnexpectedResponse (HTTP 302)", DescribeErrorResponse(302, ""));
}

TEST_F(Utils, DescribeErrorWithNonXmlBody) {
  EXPECT_EQ("InternalError (HTTP 500)",
            DescribeErrorResponse(500, "<html>oops</html"));
}

TEST_F(Utils, DescribeErrorWithCodeOnly) {
  EXPECT_EQ("SlowDown (HTTP 503)",
            DescribeErrorResponse(503, "<Error><Code>SlowDown</Code></Error>"));
}

}  // namespace tests
}  // namespace services
}  // namespace s3bulk
