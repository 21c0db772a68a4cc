#ifndef INGESTVAULT_WORKER_POOL_HPP
#define INGESTVAULT_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace ingestvault {

/**
 * @brief Fixed-size thread pool with a bounded backlog.
 *
 * submit() blocks while the number of queued plus running tasks has reached
 * workers + backlog, so a producer can never queue unboundedly.
 */
class WorkerPool {
public:
  /**
   * @param workers Number of threads (at least 1).
   * @param backlog Tasks allowed to wait beyond the running ones.
   */
  explicit WorkerPool(std::size_t workers, std::size_t backlog = 0);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <class F>
  auto submit(F &&f) -> std::future<decltype(f())>;

  /** Block until every submitted task has finished. */
  void waitIdle();

  std::size_t workerCount() const { return workers_.size(); }

  /** Tasks queued or running right now. */
  std::size_t inFlight() const;

private:
  void workerLoop();

  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::size_t capacity_;
  std::size_t active_ = 0;

  mutable std::mutex mutex_;
  std::condition_variable taskReady_;
  std::condition_variable spaceAvailable_;
  std::condition_variable idle_;
  bool stop_ = false;
};

template <class F>
auto WorkerPool::submit(F &&f) -> std::future<decltype(f())> {
  using return_type = decltype(f());

  auto task =
      std::make_shared<std::packaged_task<return_type()>>(std::forward<F>(f));
  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(mutex_);
    spaceAvailable_.wait(lock, [this]() {
      return stop_ || tasks_.size() + active_ < capacity_;
    });
    if (stop_)
      throw std::runtime_error("submit on stopped WorkerPool");
    tasks_.emplace([task]() { (*task)(); });
  }
  taskReady_.notify_one();
  return res;
}

} // namespace ingestvault

#endif // INGESTVAULT_WORKER_POOL_HPP
