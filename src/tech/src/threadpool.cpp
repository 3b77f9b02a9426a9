#include "threadpool.hpp"

#include <mutex>
#include <utility>

#include "fxt_invalid_argument_exception.hpp"
#include "fxt_log.hpp"

namespace fxt {

ThreadPool::ThreadPool(int nbThreads) {
  if (nbThreads < 1) {
    throw invalid_argument("Number of threads {} should be strictly positive", nbThreads);
  }
  _workers.reserve(static_cast<decltype(_workers)::size_type>(nbThreads));
  for (int threadPos = 0; threadPos < nbThreads; ++threadPos) {
    _workers.emplace_back(&ThreadPool::processTasks, this);
  }
  log::trace("Started ThreadPool of {} worker(s)", nbThreads);
}

void ThreadPool::processTasks() {
  while (true) {
    TasksQueue::value_type task;
    {
      std::unique_lock<std::mutex> lock(_queueMutex);
      _condition.wait(lock, [this] { return _stop || !_tasks.empty(); });
      // remaining tasks are still executed when stopping
      if (_tasks.empty()) {
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop();
    }
    // exceptions are stored in the future of the packaged task
    task();
  }
}

ThreadPool::~ThreadPool() {
  {
    std::lock_guard<std::mutex> guard(_queueMutex);
    _stop = true;
  }
  _condition.notify_all();
}

}  // namespace fxt
