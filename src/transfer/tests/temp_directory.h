#ifndef S3BULK_TRANSFER_TESTS_TEMP_DIRECTORY_H
#define S3BULK_TRANSFER_TESTS_TEMP_DIRECTORY_H

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace s3bulk {
namespace transfer {
namespace tests {
// Scratch directory under /tmp, removed with its contents on destruction.
class TempDirectory {
 public:
  TempDirectory() {
    char name[] = "/tmp/" PACKAGE_NAME ".test-XXXXXX";
    if (!mkdtemp(name))
      throw std::runtime_error("failed to create temporary directory.");
    path_ = name;
  }

  ~TempDirectory() {
    nftw(path_.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
  }

  inline const std::string &path() const { return path_; }

  std::string Join(const std::string &relative) const {
    return path_ + "/" + relative;
  }

  static void WriteFile(const std::string &path, const std::string &contents) {
    std::ofstream f(path, std::ofstream::out | std::ofstream::trunc |
                              std::ofstream::binary);
    f << contents;
  }

  static std::string ReadFile(const std::string &path) {
    std::ifstream f(path, std::ifstream::in | std::ifstream::binary);
    return std::string(std::istreambuf_iterator<char>(f),
                       std::istreambuf_iterator<char>());
  }

  static bool Exists(const std::string &path) {
    struct stat s;
    return stat(path.c_str(), &s) == 0;
  }

 private:
  static int RemoveEntry(const char *path, const struct stat *, int,
                         struct FTW *) {
    return remove(path);
  }

  std::string path_;
};
}  // namespace tests
}  // namespace transfer
}  // namespace s3bulk

#endif
