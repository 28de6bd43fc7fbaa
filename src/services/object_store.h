/*
 * services/object_store.h
 * -------------------------------------------------------------------------
 * Interface to a remote key/blob store.
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

#ifndef S3BULK_SERVICES_OBJECT_STORE_H
#define S3BULK_SERVICES_OBJECT_STORE_H

#include <sys/types.h>

#include <cstdint>
#include <string>

namespace s3bulk {
namespace services {
// Destination for an object's contents.
class ObjectSink {
 public:
  virtual ~ObjectSink() = default;

  // Called once the store has accepted the request, before the first Write()
  // (and also for empty objects). Returns 0 or a negative errno value.
  virtual int Open() = 0;

  // Returns 0 or a negative errno value, which aborts the transfer.
  virtual int Write(const char *data, size_t size) = 0;
};

// Source for an object's contents.
class ObjectSource {
 public:
  virtual ~ObjectSource() = default;

  virtual uint64_t size() const = 0;

  // Returns the number of bytes read into |buffer|, 0 at end of input, or a
  // negative errno value, which aborts the transfer.
  virtual ssize_t Read(char *buffer, size_t size) = 0;
};

// Implementations must be safe to call from several threads at once.
class ObjectStore {
 public:
  virtual ~ObjectStore() = default;

  // Streams |bucket|/|key| into |sink|. Returns 0, or the error a sink call
  // returned. Throws base::RemoteError if the store fails the request.
  virtual int Get(const std::string &bucket, const std::string &key,
                  ObjectSink *sink) const = 0;

  // Stores the contents of |source| as |bucket|/|key|. Returns 0, or the
  // error a source call returned. Throws base::RemoteError if the store fails
  // the request.
  virtual int Put(const std::string &bucket, const std::string &key,
                  ObjectSource *source) const = 0;
};
}  // namespace services
}  // namespace s3bulk

#endif
