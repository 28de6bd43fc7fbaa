#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "crypto/private_file.h"

namespace s3bulk {
namespace crypto {
namespace tests {

namespace {
constexpr char TEMP_FILE[] = "/tmp/" PACKAGE_NAME ".test-private-file";

void WriteFile(mode_t mode) {
  unlink(TEMP_FILE);
  {
    std::ofstream f(TEMP_FILE, std::ofstream::out | std::ofstream::trunc);
    f << "AKIDEXAMPLE secret\n";
  }
  chmod(TEMP_FILE, mode);
}
}  // namespace

TEST(PrivateFile, OwnerOnly) {
  std::ifstream f;
  std::string line;

  WriteFile(0600);
  ASSERT_NO_THROW(PrivateFile::Open(TEMP_FILE, &f));
  std::getline(f, line);
  EXPECT_EQ("AKIDEXAMPLE secret", line);

  unlink(TEMP_FILE);
}

TEST(PrivateFile, GroupReadable) {
  std::ifstream f;

  WriteFile(0640);
  EXPECT_THROW(PrivateFile::Open(TEMP_FILE, &f), std::runtime_error);

  unlink(TEMP_FILE);
}

TEST(PrivateFile, Missing) {
  std::ifstream f;

  unlink(TEMP_FILE);
  EXPECT_THROW(PrivateFile::Open(TEMP_FILE, &f), std::runtime_error);
}

}  // namespace tests
}  // namespace crypto
}  // namespace s3bulk
