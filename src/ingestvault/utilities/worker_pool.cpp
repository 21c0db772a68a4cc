#include "ingestvault/utilities/worker_pool.hpp"

namespace ingestvault {

WorkerPool::WorkerPool(std::size_t workers, std::size_t backlog) {
  if (workers == 0)
    workers = 1;
  capacity_ = workers + backlog;
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.emplace_back([this]() { workerLoop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    stop_ = true;
  }
  taskReady_.notify_all();
  spaceAvailable_.notify_all();
  for (std::thread &worker : workers_)
    worker.join();
}

void WorkerPool::workerLoop() {
  for (;;) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      taskReady_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });
      if (stop_ && tasks_.empty())
        return;
      task = std::move(tasks_.front());
      tasks_.pop();
      ++active_;
    }

    // packaged_task stores any exception in the caller's future.
    task();

    {
      std::unique_lock<std::mutex> lock(mutex_);
      --active_;
      if (tasks_.empty() && active_ == 0)
        idle_.notify_all();
    }
    spaceAvailable_.notify_one();
  }
}

void WorkerPool::waitIdle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_.wait(lock, [this]() { return tasks_.empty() && active_ == 0; });
}

std::size_t WorkerPool::inFlight() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size() + active_;
}

} // namespace ingestvault
