/*
 * transfer/local_file.h
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

#ifndef S3BULK_TRANSFER_LOCAL_FILE_H
#define S3BULK_TRANSFER_LOCAL_FILE_H

#include <sys/types.h>

#include <string>
#include <vector>

#include "services/object_store.h"

namespace s3bulk {
namespace transfer {
// Writes an object to |path|, creating or truncating the file only when
// Open() is called.
class LocalFileSink : public services::ObjectSink {
 public:
  static constexpr mode_t FILE_MODE = 0644;

  LocalFileSink(const std::string &path, size_t buffer_size);
  ~LocalFileSink() override;

  // BEGIN services::ObjectSink
  int Open() override;
  int Write(const char *data, size_t size) override;
  // END services::ObjectSink

  // Flushes buffered data and closes the file. Returns 0 or -errno.
  int Close();

  inline const std::string &path() const { return path_; }
  inline bool is_open() const { return fd_ != -1; }
  inline uint64_t bytes_written() const { return bytes_written_; }

 private:
  int Flush();
  int WriteAll(const char *data, size_t size);

  std::string path_;
  int fd_ = -1;
  std::vector<char> buffer_;
  size_t buffer_size_;
  uint64_t bytes_written_ = 0;
};

// Reads a regular file sequentially.
class LocalFileSource : public services::ObjectSource {
 public:
  explicit LocalFileSource(const std::string &path);
  ~LocalFileSource() override;

  // Opens the file and records its size. Returns 0 or -errno.
  int Open();

  // BEGIN services::ObjectSource
  inline uint64_t size() const override { return size_; }
  ssize_t Read(char *buffer, size_t size) override;
  // END services::ObjectSource

  inline const std::string &path() const { return path_; }
  inline uint64_t bytes_read() const { return bytes_read_; }

 private:
  std::string path_;
  int fd_ = -1;
  uint64_t size_ = 0;
  uint64_t bytes_read_ = 0;
};
}  // namespace transfer
}  // namespace s3bulk

#endif
