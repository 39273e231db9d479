#include "core/ThreadPool.hpp"

namespace recon::core {

ThreadPool::ThreadPool(int iSize) {
  if (iSize <= 0) {
    iSize = static_cast<int>(std::thread::hardware_concurrency());
    if (iSize <= 0) iSize = 1;
  }

  _vWorkers.reserve(static_cast<size_t>(iSize));
  for (int i = 0; i < iSize; ++i) {
    _vWorkers.emplace_back([this](std::stop_token stToken) { workerLoop(stToken); });
  }
}

ThreadPool::~ThreadPool() {
  shutdown();
}

void ThreadPool::workerLoop(std::stop_token stToken) {
  while (true) {
    std::packaged_task<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mtx);
      _cv.wait(lock, [this, &stToken]() {
        return _bStopping || stToken.stop_requested() || !_qTasks.empty();
      });
      if (_qTasks.empty()) {
        return;  // stopping and drained
      }
      task = std::move(_qTasks.front());
      _qTasks.pop();
    }
    // Exceptions are captured in the task's future
    task();
  }
}

void ThreadPool::shutdown() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (_bStopping && _vWorkers.empty()) return;
    _bStopping = true;
  }
  _cv.notify_all();

  for (auto& thWorker : _vWorkers) {
    if (thWorker.joinable()) {
      thWorker.join();
    }
  }
  _vWorkers.clear();
}

}  // namespace recon::core
