#ifndef S3BULK_TRANSFER_TESTS_MEMORY_OBJECT_STORE_H
#define S3BULK_TRANSFER_TESTS_MEMORY_OBJECT_STORE_H

#include <errno.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "base/errors.h"
#include "services/object_store.h"

namespace s3bulk {
namespace transfer {
namespace tests {
// Object store held in memory that records how many calls overlap.
class MemoryObjectStore : public services::ObjectStore {
 public:
  static constexpr size_t CHUNK_SIZE = 7;

  int Get(const std::string &bucket, const std::string &key,
          services::ObjectSink *sink) const override {
    CallScope scope(this);
    std::string contents;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++gets_;
      if (failing_keys_.count(key))
        throw base::RemoteError(key, "InternalError (HTTP 500)");

      auto iter = objects_.find(ObjectName(bucket, key));
      if (iter == objects_.end())
        throw base::RemoteError(key, "NoSuchKey (HTTP 404)");
      contents = iter->second;
    }

    int r = sink->Open();
    if (r) return r;

    for (size_t pos = 0; pos < contents.size(); pos += CHUNK_SIZE) {
      const size_t remaining = contents.size() - pos;
      r = sink->Write(contents.data() + pos,
                      remaining < CHUNK_SIZE ? remaining : CHUNK_SIZE);
      if (r) return r;
    }

    return 0;
  }

  int Put(const std::string &bucket, const std::string &key,
          services::ObjectSource *source) const override {
    CallScope scope(this);
    std::string contents;
    std::vector<char> buffer(CHUNK_SIZE);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++puts_;
      if (failing_keys_.count(key))
        throw base::RemoteError(key, "AccessDenied (HTTP 403)");
    }

    while (contents.size() < source->size()) {
      ssize_t r = source->Read(buffer.data(), buffer.size());
      if (r < 0) return static_cast<int>(r);
      if (r == 0) throw base::RemoteError(key, "short body");
      contents.append(buffer.data(), r);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    objects_[ObjectName(bucket, key)] = contents;
    return 0;
  }

  void Add(const std::string &bucket, const std::string &key,
           const std::string &contents) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[ObjectName(bucket, key)] = contents;
  }

  bool Find(const std::string &bucket, const std::string &key,
            std::string *contents) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = objects_.find(ObjectName(bucket, key));
    if (iter == objects_.end()) return false;
    *contents = iter->second;
    return true;
  }

  // Calls for |key| throw base::RemoteError.
  void FailKey(const std::string &key) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_keys_.insert(key);
  }

  // Each call waits (for at most two seconds) until |overlap| calls have
  // been in progress at once.
  void set_expected_overlap(int overlap) { expected_overlap_ = overlap; }

  inline int peak_calls_in_progress() const { return peak_; }
  inline int gets() const { return gets_; }
  inline int puts() const { return puts_; }

 private:
  class CallScope {
   public:
    explicit CallScope(const MemoryObjectStore *store) : store_(store) {
      int now = ++store_->in_progress_;
      int peak = store_->peak_;
      while (now > peak && !store_->peak_.compare_exchange_weak(peak, now)) {
      }
      if (store_->expected_overlap_ > 1) {
        std::unique_lock<std::mutex> lock(store_->overlap_mutex_);
        store_->overlap_condition_.notify_all();
        store_->overlap_condition_.wait_for(
            lock, std::chrono::seconds(2), [this] {
              return store_->peak_ >= store_->expected_overlap_;
            });
      }
    }

    ~CallScope() { --store_->in_progress_; }

   private:
    const MemoryObjectStore *store_;
  };

  static std::string ObjectName(const std::string &bucket,
                                const std::string &key) {
    return bucket + "/" + key;
  }

  mutable std::mutex mutex_;
  mutable std::map<std::string, std::string> objects_;
  std::set<std::string> failing_keys_;
  int expected_overlap_ = 0;

  mutable std::mutex overlap_mutex_;
  mutable std::condition_variable overlap_condition_;

  mutable std::atomic_int in_progress_{0}, peak_{0};
  mutable std::atomic_int gets_{0}, puts_{0};
};
}  // namespace tests
}  // namespace transfer
}  // namespace s3bulk

#endif
