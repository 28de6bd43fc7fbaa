#include <atomic>
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "threads/fan_out.h"
#include "threads/tests/rendezvous.h"

namespace s3bulk {
namespace threads {
namespace tests {

namespace {
struct Result {
  int item;
  std::string error;
};

Result Fail(const int &item, const std::string &error) { return {item, error}; }
}  // namespace

TEST(FanOut, ZeroInProgress) {
  std::vector<int> items = {1, 2, 3};

  EXPECT_THROW((FanOut<int, Result>(
                   items.begin(), items.end(), 0,
                   [](const int &i) { return Result{i, ""}; }, Fail)),
               std::invalid_argument);
}

TEST(FanOut, NoItems) {
  std::vector<int> items;
  FanOut<int, Result> fan_out(
      items.begin(), items.end(), 4,
      [](const int &i) { return Result{i, ""}; }, Fail);

  EXPECT_TRUE(fan_out.Process().empty());
}

TEST(FanOut, OneResultPerItem) {
  std::vector<int> items;
  for (int i = 0; i < 100; i++) items.push_back(i);

  FanOut<int, Result> fan_out(
      items.begin(), items.end(), 8,
      [](const int &i) {
        if (i % 10 == 3) throw std::runtime_error("item failed");
        return Result{i, ""};
      },
      Fail);

  const auto results = fan_out.Process();
  ASSERT_EQ(items.size(), results.size());

  std::set<int> seen;
  int failures = 0;
  for (const auto &r : results) {
    seen.insert(r.item);
    if (!r.error.empty()) {
      EXPECT_EQ(3, r.item % 10);
      EXPECT_EQ("item failed", r.error);
      ++failures;
    }
  }

  EXPECT_EQ(items.size(), seen.size());
  EXPECT_EQ(10, failures);
}

TEST(FanOut, NeverExceedsLimit) {
  std::vector<int> items;
  for (int i = 0; i < 24; i++) items.push_back(i);

  for (size_t limit = 1; limit <= items.size(); limit *= 2) {
    std::atomic_int in_progress(0), peak(0);

    FanOut<int, Result> fan_out(
        items.begin(), items.end(), limit,
        [&in_progress, &peak](const int &i) {
          int now = ++in_progress;
          int p = peak;
          while (now > p && !peak.compare_exchange_weak(p, now)) {
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(2));
          --in_progress;
          return Result{i, ""};
        },
        Fail);

    EXPECT_EQ(items.size(), fan_out.Process().size());
    EXPECT_LE(peak, static_cast<int>(limit)) << "for limit = " << limit;
  }
}

TEST(FanOut, RunsUpToLimitAtOnce) {
  std::vector<int> items;
  for (int i = 0; i < 16; i++) items.push_back(i);

  for (size_t limit : {2, 4, 16}) {
    Rendezvous rendezvous(static_cast<int>(limit));

    FanOut<int, Result> fan_out(items.begin(), items.end(), limit,
                                [&rendezvous](const int &i) {
                                  Rendezvous::Scope scope(&rendezvous);
                                  return Result{i, ""};
                                },
                                Fail);

    EXPECT_EQ(items.size(), fan_out.Process().size());
    EXPECT_EQ(static_cast<int>(limit), rendezvous.peak())
        << "for limit = " << limit;
  }
}

TEST(FanOut, LimitAboveItemCount) {
  std::vector<int> items = {1, 2, 3, 4, 5};
  Rendezvous rendezvous(static_cast<int>(items.size()));

  FanOut<int, Result> fan_out(items.begin(), items.end(), 32,
                              [&rendezvous](const int &i) {
                                Rendezvous::Scope scope(&rendezvous);
                                return Result{i, ""};
                              },
                              Fail);

  EXPECT_EQ(items.size(), fan_out.Process().size());
  EXPECT_EQ(static_cast<int>(items.size()), rendezvous.peak());
}

}  // namespace tests
}  // namespace threads
}  // namespace s3bulk
