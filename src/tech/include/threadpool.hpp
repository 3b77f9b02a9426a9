#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>

#include "fxt_exception.hpp"
#include "fxt_vector.hpp"

namespace fxt {

/// @brief C++ ThreadPool implementation. Number of threads is to be specified at creation of the object.
/// @note original code taken from https://github.com/progschj/ThreadPool/blob/master/ThreadPool.h, with modifications:
///         - Rule of 5: delete all special members.
///         - C++20 version with std::invoke_result instead of std::result_of and std::jthread that calls join
///         automatically
/// Tasks already enqueued are all executed before the destructor returns.
class ThreadPool {
 public:
  explicit ThreadPool(int nbThreads = 1);

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  ~ThreadPool();

  auto nbWorkers() const noexcept { return _workers.size(); }

  // Add new work item to the pool
  // By default, arguments will be copied for safety. If you want to pass arguments by reference,
  // make sure that the reference lifetime is valid through the whole execution time of the future,
  // and wrap the argument you want to pass by reference with 'std::ref'.
  template <class Func, class... Args>
  std::future<std::invoke_result_t<Func, Args...>> enqueue(Func&& func, Args&&... args);

 private:
  using TasksQueue = std::queue<std::function<void()>>;

  void processTasks();

  // the task queue
  TasksQueue _tasks;

  // synchronization
  std::mutex _queueMutex;
  std::condition_variable _condition;
  bool _stop = false;

  // join is automatically called at the destruction of the std::jthread.
  // '_workers' should be destroyed first at ThreadPool destruction so it must be placed as last member.
  vector<std::jthread> _workers;
};

template <class Func, class... Args>
inline std::future<std::invoke_result_t<Func, Args...>> ThreadPool::enqueue(Func&& func, Args&&... args) {
  // std::bind copies the arguments. To avoid copies, you can use std::ref to copy reference instead.
  using return_type = std::invoke_result_t<Func, Args...>;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<Func>(func), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(_queueMutex);

    if (_stop) {
      throw exception("Cannot enqueue a task on a ThreadPool being destroyed");
    }

    _tasks.emplace([task]() { (*task)(); });
  }
  _condition.notify_one();
  return res;
}

}  // namespace fxt
