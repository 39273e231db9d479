#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace recon::core {

/// Fixed-size pool of std::jthread workers.
/// The pool size is the executor's concurrency limit for one wave.
/// Class abbreviation: tp
class ThreadPool {
 public:
  /// iSize <= 0 means std::thread::hardware_concurrency().
  explicit ThreadPool(int iSize = 0);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /// Queue a task. Throws std::runtime_error after shutdown().
  template <typename F, typename... Args>
  auto submit(F&& fnTask, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

  /// Finish queued tasks, then join all workers. Idempotent.
  void shutdown();

  int size() const { return static_cast<int>(_vWorkers.size()); }

 private:
  void workerLoop(std::stop_token stToken);

  std::vector<std::jthread> _vWorkers;
  std::queue<std::packaged_task<void()>> _qTasks;
  std::mutex _mtx;
  std::condition_variable _cv;
  bool _bStopping = false;
};

template <typename F, typename... Args>
auto ThreadPool::submit(F&& fnTask, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>> {
  using R = std::invoke_result_t<F, Args...>;

  auto spTask = std::make_shared<std::packaged_task<R()>>(
      std::bind(std::forward<F>(fnTask), std::forward<Args>(args)...));
  std::future<R> fut = spTask->get_future();

  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping) {
      throw std::runtime_error("ThreadPool: submit after shutdown");
    }
    _qTasks.emplace([spTask]() { (*spTask)(); });
  }
  _cv.notify_one();
  return fut;
}

}  // namespace recon::core
