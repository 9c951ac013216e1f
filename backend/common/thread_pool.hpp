#pragma once

#include <vector>
#include <thread>
#include <future>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace common {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int size = std::thread::hardware_concurrency());
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <typename Func, typename... Args>
    auto commit(Func&& func, Args&&... args) -> std::future<std::invoke_result_t<Func, Args...>> {
        using ReturnType = std::invoke_result_t<Func, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<Func>(func), std::forward<Args>(args)...)
        );

        auto ret = task->get_future();
        {
            std::lock_guard<std::mutex> lock{_mtx};
            // nothing is queued once shutdown() has set _stop
            if (_stop.load(std::memory_order_relaxed)) {
                throw std::runtime_error("ThreadPool is stopped");
            }
            _tasks.emplace([task]() { (*task)(); });
        }
        _cv.notify_one();
        return ret;
    }

    // Drains the queue, then joins every thread. Later commits throw.
    void shutdown();

    size_t size() const { return _poolSize; }
    size_t pending() const;

private:
    using Task = std::packaged_task<void()>;

    void workerLoop();

    mutable std::mutex _mtx;
    std::condition_variable _cv;

    std::queue<Task> _tasks;
    std::vector<std::jthread> _threads;

    std::atomic_bool _stop{false};
    size_t _poolSize{0};
};

} // namespace common
