#include "thread_pool.hpp"

namespace common {

ThreadPool::ThreadPool(unsigned int size) {
  if (size < 1) {
    _poolSize = 2;
  } else {
    _poolSize = size;
  }
  _threads.reserve(_poolSize);

  for (unsigned int i = 0; i < _poolSize; i++) {
    _threads.emplace_back([this]() -> void { workerLoop(); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop() {
  // 每个线程循环处理任务
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock{_mtx};
      _cv.wait(lock, [this]() -> bool {
        return _stop.load(std::memory_order_acquire) || !_tasks.empty();
      });

      // 唤醒后，若线程池被关闭且任务为空则退出
      if (_stop.load(std::memory_order_acquire) && _tasks.empty()) {
        break;
      }

      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock{_mtx};
    _stop.store(true, std::memory_order_release);
  }
  _cv.notify_all();
  for (auto& thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

size_t ThreadPool::pending() const {
  std::lock_guard<std::mutex> lock{_mtx};
  return _tasks.size();
}

} // namespace common
