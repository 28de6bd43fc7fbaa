/*
 * transfer/executor.cc
 * -------------------------------------------------------------------------
 * Moves one object between the store and a local file.
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

#include "transfer/executor.h"

#include <atomic>
#include <exception>

#include "base/config.h"
#include "base/errors.h"
#include "base/logger.h"
#include "base/statistics.h"
#include "base/timer.h"
#include "services/object_store.h"
#include "transfer/local_file.h"

namespace s3bulk {
namespace transfer {

namespace {
std::atomic_int s_downloads_succeeded(0), s_downloads_failed(0);
std::atomic_int s_uploads_succeeded(0), s_uploads_failed(0);
std::atomic<uint64_t> s_bytes_downloaded(0), s_bytes_uploaded(0);

void StatsWriter(std::ostream *o) {
  *o << "transfers:\n"
        "  downloads succeeded: "
     << s_downloads_succeeded
     << "\n"
        "  downloads failed: "
     << s_downloads_failed
     << "\n"
        "  bytes downloaded: "
     << s_bytes_downloaded
     << "\n"
        "  uploads succeeded: "
     << s_uploads_succeeded
     << "\n"
        "  uploads failed: "
     << s_uploads_failed
     << "\n"
        "  bytes uploaded: "
     << s_bytes_uploaded << "\n";
}

base::Statistics::Writers::Entry s_writer(StatsWriter, 0);

std::string DoDownload(const services::ObjectStore *store,
                       const std::string &bucket, const std::string &key,
                       const std::string &local_path) {
  LocalFileSink sink(local_path, base::Config::io_buffer_size());
  const double start = base::Timer::GetCurrentTime();

  int r = store->Get(bucket, key, &sink);
  if (r)
    throw base::IoError(local_path, -r, sink.is_open() ? "write" : "create");

  r = sink.Close();
  if (r) throw base::IoError(local_path, -r, "write");

  s_bytes_downloaded += sink.bytes_written();

  S3BULK_LOG(LOG_DEBUG, "Executor::Download",
             "[%s] -> [%s]: %llu bytes in %.3f s.\n", key.c_str(),
             local_path.c_str(),
             static_cast<unsigned long long>(sink.bytes_written()),
             base::Timer::GetCurrentTime() - start);

  return local_path;
}

std::string DoUpload(const services::ObjectStore *store,
                     const std::string &bucket, const std::string &key,
                     const std::string &local_path) {
  LocalFileSource source(local_path);
  const double start = base::Timer::GetCurrentTime();

  int r = source.Open();
  if (r) throw base::IoError(local_path, -r, "open");

  r = store->Put(bucket, key, &source);
  if (r) throw base::IoError(local_path, -r, "read");

  s_bytes_uploaded += source.bytes_read();

  S3BULK_LOG(LOG_DEBUG, "Executor::Upload",
             "[%s] -> [%s]: %llu bytes in %.3f s.\n", local_path.c_str(),
             key.c_str(), static_cast<unsigned long long>(source.size()),
             base::Timer::GetCurrentTime() - start);

  return local_path;
}
}  // namespace

std::string Executor::Download(const services::ObjectStore *store,
                               const std::string &bucket,
                               const std::string &key,
                               const std::string &local_path) {
  try {
    DoDownload(store, bucket, key, local_path);
  } catch (const std::exception &) {
    ++s_downloads_failed;
    throw;
  }

  ++s_downloads_succeeded;
  return local_path;
}

std::string Executor::Upload(const services::ObjectStore *store,
                             const std::string &bucket, const std::string &key,
                             const std::string &local_path) {
  try {
    DoUpload(store, bucket, key, local_path);
  } catch (const std::exception &) {
    ++s_uploads_failed;
    throw;
  }

  ++s_uploads_succeeded;
  return local_path;
}

}  // namespace transfer
}  // namespace s3bulk
