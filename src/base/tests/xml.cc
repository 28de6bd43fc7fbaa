#include <errno.h>

#include <mutex>
#include <string>

#include <gtest/gtest.h>

#include "base/xml.h"

namespace s3bulk {
namespace base {
namespace tests {

namespace {
constexpr char S3_ERROR[] =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<Error><Code>NoSuchKey</Code><Message>The specified key does not "
    "exist.</Message><Key>k2</Key><RequestId>4442587FB7D0A2F9</RequestId>"
    "</Error>";

class Xml : public ::testing::Test {
 protected:
  void SetUp() override {
    static std::once_flag flag;
    std::call_once(flag, []() { XmlDocument::Init(); });
  }
};
}  // namespace

TEST_F(Xml, FailOnMalformedXml) {
  EXPECT_FALSE(XmlDocument::Parse("<?xml version=\"1.0\"?><a><b></a>"));
  EXPECT_FALSE(XmlDocument::Parse("not xml at all"));
  EXPECT_FALSE(XmlDocument::Parse(""));
}

TEST_F(Xml, FindErrorFields) {
  auto doc = XmlDocument::Parse(S3_ERROR);
  ASSERT_TRUE(doc);

  std::string code, message;
  ASSERT_EQ(0, doc->Find("/Error/Code", &code));
  ASSERT_EQ(0, doc->Find("/Error/Message", &message));

  EXPECT_EQ("NoSuchKey", code);
  EXPECT_EQ("The specified key does not exist.", message);
}

TEST_F(Xml, FindMissingElement) {
  auto doc = XmlDocument::Parse(S3_ERROR);
  ASSERT_TRUE(doc);

  std::string value;
  EXPECT_EQ(-ENOENT, doc->Find("/Error/HostId", &value));
}

TEST_F(Xml, FindWithNamespace) {
  auto doc = XmlDocument::Parse(
      "<Error xmlns=\"http://s3.amazonaws.com/doc/2006-03-01/\">"
      "<Code>AccessDenied</Code></Error>");
  ASSERT_TRUE(doc);

  std::string code, message;
  ASSERT_EQ(0, doc->Find("/Error/Code", &code));
  EXPECT_EQ("AccessDenied", code);
  EXPECT_EQ(-ENOENT, doc->Find("/Error/Message", &message));
}

}  // namespace tests
}  // namespace base
}  // namespace s3bulk
