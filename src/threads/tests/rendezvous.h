#ifndef S3BULK_THREADS_TESTS_RENDEZVOUS_H
#define S3BULK_THREADS_TESTS_RENDEZVOUS_H

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace s3bulk {
namespace threads {
namespace tests {
// Holds each caller until |expected| callers have been inside at once, or
// for two seconds, and records the peak number inside.
class Rendezvous {
 public:
  class Scope {
   public:
    explicit Scope(Rendezvous *r) : r_(r) { r_->Enter(); }
    ~Scope() { r_->Leave(); }

   private:
    Rendezvous *r_;
  };

  explicit Rendezvous(int expected) : expected_(expected) {}

  inline int peak() {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
  }

 private:
  void Enter() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (++inside_ > peak_) peak_ = inside_;
    condition_.notify_all();
    condition_.wait_for(lock, std::chrono::seconds(2),
                        [this] { return peak_ >= expected_; });
  }

  void Leave() {
    std::lock_guard<std::mutex> lock(mutex_);
    --inside_;
  }

  const int expected_;
  std::mutex mutex_;
  std::condition_variable condition_;
  int inside_ = 0, peak_ = 0;
};
}  // namespace tests
}  // namespace threads
}  // namespace s3bulk

#endif
