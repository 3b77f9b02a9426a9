#include "threadpool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

#include "fxt_invalid_argument_exception.hpp"
#include "fxt_vector.hpp"

namespace fxt {

namespace {
using namespace std::chrono_literals;

int SlowDouble(const int &val) {
  if (val == 42) {
    throw std::invalid_argument("42 is not the answer to the ultimate question of life");
  }
  std::this_thread::sleep_for(10ms);
  return val * 2;
}

int SlowAdd(const int &lhs, const int &rhs) {
  std::this_thread::sleep_for(10ms);
  return lhs + rhs;
}
}  // namespace

TEST(ThreadPoolTest, Enqueue) {
  ThreadPool threadPool(2);
  vector<std::future<int>> results;

  constexpr int kNbElems = 4;
  for (int elem = 0; elem < kNbElems; ++elem) {
    results.push_back(threadPool.enqueue(SlowDouble, elem));
  }

  for (int elem = 0; elem < kNbElems; ++elem) {
    EXPECT_EQ(results[elem].get(), elem * 2);
  }
}

TEST(ThreadPoolTest, EnqueueSeveralArguments) {
  ThreadPool threadPool(1);
  EXPECT_EQ(threadPool.enqueue(SlowAdd, 3, 4).get(), 7);
}

TEST(ThreadPoolTest, EnqueueExceptionPropagatedToFuture) {
  ThreadPool threadPool(1);
  auto res = threadPool.enqueue(SlowDouble, 42);
  EXPECT_THROW(res.get(), std::invalid_argument);
}

TEST(ThreadPoolTest, PendingTasksExecutedAtDestruction) {
  std::atomic<int> nbExecutedTasks{0};
  {
    ThreadPool threadPool(1);
    for (int taskPos = 0; taskPos < 3; ++taskPos) {
      threadPool.enqueue([&nbExecutedTasks] {
        std::this_thread::sleep_for(5ms);
        ++nbExecutedTasks;
      });
    }
  }
  EXPECT_EQ(nbExecutedTasks.load(), 3);
}

TEST(ThreadPoolTest, InvalidNumberOfThreads) { EXPECT_THROW(ThreadPool(0), invalid_argument); }

}  // namespace fxt
