/*
 * transfer/local_file.cc
 * -------------------------------------------------------------------------
 * Object sinks and sources backed by local files.
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

#include "transfer/local_file.h"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>

#include "base/logger.h"

namespace s3bulk {
namespace transfer {

constexpr mode_t LocalFileSink::FILE_MODE;

LocalFileSink::LocalFileSink(const std::string &path, size_t buffer_size)
    : path_(path), buffer_size_(std::max<size_t>(buffer_size, 1)) {}

LocalFileSink::~LocalFileSink() {
  if (fd_ == -1) return;

  int r = Close();
  if (r)
    S3BULK_LOG(LOG_WARNING, "LocalFileSink::~LocalFileSink",
               "failed to close [%s]: %i\n", path_.c_str(), r);
}

int LocalFileSink::Open() {
  if (fd_ != -1) return 0;

  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
               FILE_MODE);
  if (fd_ == -1) return -errno;

  buffer_.reserve(buffer_size_);
  return 0;
}

int LocalFileSink::Write(const char *data, size_t size) {
  if (fd_ == -1) return -EBADF;

  if (buffer_.size() + size > buffer_size_) {
    int r = Flush();
    if (r) return r;
  }

  if (size >= buffer_size_) return WriteAll(data, size);

  buffer_.insert(buffer_.end(), data, data + size);
  return 0;
}

int LocalFileSink::Close() {
  if (fd_ == -1) return 0;

  int r = Flush();
  if (::close(fd_) && !r) r = -errno;
  fd_ = -1;

  return r;
}

int LocalFileSink::Flush() {
  if (buffer_.empty()) return 0;

  int r = WriteAll(buffer_.data(), buffer_.size());
  buffer_.clear();
  return r;
}

int LocalFileSink::WriteAll(const char *data, size_t size) {
  while (size) {
    ssize_t r = ::write(fd_, data, size);

    if (r == -1) {
      if (errno == EINTR) continue;
      return -errno;
    }

    data += r;
    size -= r;
    bytes_written_ += r;
  }

  return 0;
}

LocalFileSource::LocalFileSource(const std::string &path) : path_(path) {}

LocalFileSource::~LocalFileSource() {
  if (fd_ != -1) ::close(fd_);
}

int LocalFileSource::Open() {
  struct stat s;

  if (fd_ != -1) return 0;

  fd_ = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ == -1) return -errno;

  if (fstat(fd_, &s) == -1) return -errno;
  if (S_ISDIR(s.st_mode)) return -EISDIR;
  if (!S_ISREG(s.st_mode)) return -EINVAL;

  size_ = s.st_size;
  return 0;
}

ssize_t LocalFileSource::Read(char *buffer, size_t size) {
  if (fd_ == -1) return -EBADF;

  while (true) {
    ssize_t r = ::read(fd_, buffer, size);

    if (r == -1) {
      if (errno == EINTR) continue;
      return -errno;
    }

    bytes_read_ += r;
    return r;
  }
}

}  // namespace transfer
}  // namespace s3bulk
