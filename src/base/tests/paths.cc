#include <stdlib.h>

#include <string>

#include <gtest/gtest.h>

#include "base/paths.h"

namespace s3bulk {
namespace base {
namespace tests {

TEST(Paths, TransformHome) {
  const char *home = getenv("HOME");
  if (!home) return;

  EXPECT_EQ(std::string(home) + "/.s3bulk/s3bulk.conf",
            Paths::Transform("~/.s3bulk/s3bulk.conf"));
}

TEST(Paths, TransformLeavesOtherPathsAlone) {
  EXPECT_EQ("/etc/s3bulk.conf", Paths::Transform("/etc/s3bulk.conf"));
  EXPECT_EQ("relative/~file", Paths::Transform("relative/~file"));
  EXPECT_EQ("", Paths::Transform(""));
}

}  // namespace tests
}  // namespace base
}  // namespace s3bulk
