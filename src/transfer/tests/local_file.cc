#include <errno.h>
#include <sys/stat.h>

#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "transfer/local_file.h"
#include "transfer/tests/temp_directory.h"

namespace s3bulk {
namespace transfer {
namespace tests {

TEST(LocalFileSink, NothingCreatedBeforeOpen) {
  TempDirectory temp;
  const std::string path = temp.Join("out.bin");

  {
    LocalFileSink sink(path, 16);
    EXPECT_FALSE(sink.is_open());
    EXPECT_EQ(-EBADF, sink.Write("abc", 3));
  }

  EXPECT_FALSE(TempDirectory::Exists(path));
}

TEST(LocalFileSink, BufferedWrites) {
  TempDirectory temp;
  const std::string path = temp.Join("out.bin");
  std::string expected;

  LocalFileSink sink(path, 16);
  ASSERT_EQ(0, sink.Open());

  for (int i = 0; i < 50; i++) {
    const std::string chunk(i % 37, static_cast<char>('a' + i % 26));
    expected += chunk;
    ASSERT_EQ(0, sink.Write(chunk.data(), chunk.size()));
  }

  ASSERT_EQ(0, sink.Close());
  EXPECT_EQ(expected.size(), sink.bytes_written());
  EXPECT_EQ(expected, TempDirectory::ReadFile(path));
}

TEST(LocalFileSink, OpenTruncates) {
  TempDirectory temp;
  const std::string path = temp.Join("out.bin");

  TempDirectory::WriteFile(path, "previous, longer contents");

  LocalFileSink sink(path, 1024);
  ASSERT_EQ(0, sink.Open());
  ASSERT_EQ(0, sink.Write("new", 3));
  ASSERT_EQ(0, sink.Close());

  EXPECT_EQ("new", TempDirectory::ReadFile(path));

  struct stat s;
  ASSERT_EQ(0, stat(path.c_str(), &s));
  EXPECT_TRUE(S_ISREG(s.st_mode));
}

TEST(LocalFileSink, OpenInMissingDirectory) {
  TempDirectory temp;
  LocalFileSink sink(temp.Join("missing/out.bin"), 16);

  EXPECT_EQ(-ENOENT, sink.Open());
}

TEST(LocalFileSource, ReadsWholeFile) {
  TempDirectory temp;
  const std::string path = temp.Join("in.bin");
  const std::string contents(10000, 'z');

  TempDirectory::WriteFile(path, contents);

  LocalFileSource source(path);
  ASSERT_EQ(0, source.Open());
  EXPECT_EQ(contents.size(), source.size());

  std::string read;
  std::vector<char> buffer(333);
  ssize_t r;
  while ((r = source.Read(buffer.data(), buffer.size())) > 0)
    read.append(buffer.data(), r);

  EXPECT_EQ(0, r);
  EXPECT_EQ(contents, read);
  EXPECT_EQ(contents.size(), source.bytes_read());
}

TEST(LocalFileSource, OpenErrors) {
  TempDirectory temp;

  LocalFileSource missing(temp.Join("missing"));
  EXPECT_EQ(-ENOENT, missing.Open());

  LocalFileSource directory(temp.path());
  EXPECT_EQ(-EISDIR, directory.Open());
}

}  // namespace tests
}  // namespace transfer
}  // namespace s3bulk
