#ifndef SCANTEXT_WORKER_POOL_HPP
#define SCANTEXT_WORKER_POOL_HPP

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace scantext {

/**
 * @brief Bounded thread pool for blocking recognition calls
 *
 * One pool is created per serving process at startup and shut down
 * explicitly. Admission is bounded: a job is accepted while the number of
 * jobs waiting for a thread (beyond the idle threads that will pick them up)
 * stays below maxQueued; anything more is refused so callers can report
 * backpressure instead of buffering large images without limit.
 */
class WorkerPool {
public:
  /**
   * @brief Start the worker threads
   * @param threads Number of threads, at least 1
   * @param maxQueued Maximum number of jobs waiting for a thread
   */
  WorkerPool(std::size_t threads, std::size_t maxQueued);

  /**
   * @brief Calls shutdown()
   */
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * @brief Submit a job if admission allows it
   * @param job Callable run on a worker thread; exceptions it throws are
   * delivered through the returned future
   * @return The job's future, or std::nullopt if the pool refused the job
   * (queue full or shut down)
   */
  template <typename F>
  auto trySubmit(F &&job)
      -> std::optional<std::future<typename std::invoke_result<F>::type>> {
    using Result = typename std::invoke_result<F>::type;

    auto task =
        std::make_shared<std::packaged_task<Result()>>(std::forward<F>(job));
    std::future<Result> future = task->get_future();

    if (!enqueue([task]() { (*task)(); })) {
      return std::nullopt;
    }
    return future;
  }

  /**
   * @brief Stop accepting jobs, finish queued ones and join the threads
   *
   * Safe to call more than once and from several threads at once; only the
   * first caller joins, the others wait for it. Must not be called from a
   * worker thread.
   */
  void shutdown();

  bool isRunning() const;
  std::size_t threadCount() const;
  std::size_t maxQueued() const;
  std::size_t queuedJobs() const;
  std::size_t activeJobs() const;

private:
  bool enqueue(std::function<void()> job);
  void workerLoop();

  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_jobs;
  mutable std::mutex m_mutex;
  std::condition_variable m_condition;
  std::condition_variable m_joinedCondition;
  std::size_t m_maxQueued;
  std::size_t m_active;
  bool m_stopping;
  bool m_joined;
};

} // namespace scantext

#endif // SCANTEXT_WORKER_POOL_HPP
