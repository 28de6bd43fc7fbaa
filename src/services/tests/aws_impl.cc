#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "base/config.h"
#include "base/errors.h"
#include "services/aws/impl.h"

namespace s3bulk {
namespace services {
namespace aws {
namespace tests {

namespace {
constexpr char SECRET_FILE[] = "/tmp/" PACKAGE_NAME ".test-aws-secret";

const Credentials TEST_CREDENTIALS = {"AKIDEXAMPLE", "secret", ""};

Impl::Options MakeOptions(const std::string &endpoint, bool use_ssl,
                          bool virtual_host_style) {
  Impl::Options options;
  options.region = "eu-west-1";
  options.endpoint = endpoint;
  options.use_ssl = use_ssl;
  options.virtual_host_style = virtual_host_style;
  options.connect_timeout_in_s = 2;
  options.transfer_timeout_in_s = 2;
  return options;
}

class CountingSink : public ObjectSink {
 public:
  int Open() override {
    ++opens_;
    return 0;
  }

  int Write(const char *, size_t) override { return 0; }

  inline int opens() const { return opens_; }

 private:
  int opens_ = 0;
};

class ImplCredentials : public ::testing::Test {
 protected:
  void SetUp() override { base::Config::Reset(); }

  void TearDown() override {
    unlink(SECRET_FILE);
    base::Config::Reset();
  }

  void WriteSecretFile(const std::string &line) {
    unlink(SECRET_FILE);
    {
      std::ofstream f(SECRET_FILE, std::ofstream::out | std::ofstream::trunc);
      f << line << "\n";
    }
    chmod(SECRET_FILE, 0600);
    base::Config::set_aws_secret_file(SECRET_FILE);
  }
};
}  // namespace

TEST(Impl, PathStyleUrl) {
  Impl impl(MakeOptions("", true, false), TEST_CREDENTIALS);

  EXPECT_EQ("https://s3.eu-west-1.amazonaws.com/my-bucket/dir/file%20name.txt",
            impl.BuildUrl("my-bucket", "dir/file name.txt"));
}

TEST(Impl, VirtualHostStyleUrl) {
  Impl impl(MakeOptions("", false, true), TEST_CREDENTIALS);

  EXPECT_EQ("http://my-bucket.s3.eu-west-1.amazonaws.com/a/b.txt",
            impl.BuildUrl("my-bucket", "a/b.txt"));
}

TEST(Impl, CustomEndpoint) {
  Impl plain(MakeOptions("localhost:9000/", false, false), TEST_CREDENTIALS);
  EXPECT_EQ("http://localhost:9000/b/k", plain.BuildUrl("b", "k"));

  // a scheme on the endpoint wins over use_ssl
  Impl with_scheme(MakeOptions("https://minio.local", false, false),
                   TEST_CREDENTIALS);
  EXPECT_EQ("https://minio.local/b/k", with_scheme.BuildUrl("b", "k"));
}

TEST(Impl, InvalidEndpoint) {
  EXPECT_THROW(Impl(MakeOptions("http://", false, false), TEST_CREDENTIALS),
               std::runtime_error);
}

TEST(Impl, InvalidTimeouts) {
  auto options = MakeOptions("", true, false);
  options.connect_timeout_in_s = 0;
  EXPECT_THROW(Impl(options, TEST_CREDENTIALS), std::runtime_error);

  options = MakeOptions("", true, false);
  options.transfer_timeout_in_s = -1;
  EXPECT_THROW(Impl(options, TEST_CREDENTIALS), std::runtime_error);
}

TEST(Impl, UnreachableStoreIsRemoteError) {
  Impl impl(MakeOptions("127.0.0.1:1", false, false), TEST_CREDENTIALS);
  CountingSink sink;

  try {
    impl.Get("bucket", "key", &sink);
    FAIL() << "expected RemoteError";
  } catch (const base::RemoteError &e) {
    EXPECT_EQ("key", e.key());
  }

  EXPECT_EQ(0, sink.opens());
}

TEST_F(ImplCredentials, FromSecretFile) {
  WriteSecretFile("AKIDFILE secretfile");

  const auto credentials = Impl::LoadCredentials();
  EXPECT_EQ("AKIDFILE", credentials.key_id);
  EXPECT_EQ("secretfile", credentials.secret);
  EXPECT_EQ("", credentials.session_token);
}

TEST_F(ImplCredentials, FromSecretFileWithToken) {
  WriteSecretFile("AKIDFILE secretfile token");

  EXPECT_EQ("token", Impl::LoadCredentials().session_token);
}

TEST_F(ImplCredentials, MalformedSecretFile) {
  WriteSecretFile("only-one-field");

  EXPECT_THROW(Impl::LoadCredentials(), std::runtime_error);
}

TEST_F(ImplCredentials, FromEnvironment) {
  setenv("AWS_ACCESS_KEY_ID", "AKIDENV", 1);
  setenv("AWS_SECRET_ACCESS_KEY", "secretenv", 1);
  unsetenv("AWS_SESSION_TOKEN");

  const auto credentials = Impl::LoadCredentials();
  EXPECT_EQ("AKIDENV", credentials.key_id);
  EXPECT_EQ("secretenv", credentials.secret);
  EXPECT_EQ("", credentials.session_token);

  unsetenv("AWS_SECRET_ACCESS_KEY");
  EXPECT_THROW(Impl::LoadCredentials(), std::runtime_error);

  unsetenv("AWS_ACCESS_KEY_ID");
}

TEST_F(ImplCredentials, OptionsFromConfig) {
  base::Config::set_aws_region("ap-southeast-2");
  base::Config::set_aws_virtual_host_style(true);
  base::Config::set_connect_timeout_in_s(4);
  base::Config::set_transfer_timeout_in_s(40);

  const auto options = Impl::OptionsFromConfig();
  EXPECT_EQ("ap-southeast-2", options.region);
  EXPECT_TRUE(options.virtual_host_style);
  EXPECT_TRUE(options.use_ssl);
  EXPECT_EQ(4, options.connect_timeout_in_s);
  EXPECT_EQ(40, options.transfer_timeout_in_s);
}

}  // namespace tests
}  // namespace aws
}  // namespace services
}  // namespace s3bulk
