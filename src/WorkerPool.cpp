#include "scantext/WorkerPool.hpp"

#include "scantext/Logger.hpp"

#include <algorithm>

namespace scantext {

WorkerPool::WorkerPool(std::size_t threads, std::size_t maxQueued)
    : m_maxQueued(maxQueued), m_active(0), m_stopping(false),
      m_joined(false) {
  std::size_t count = std::max<std::size_t>(1, threads);
  m_workers.reserve(count);
  for (std::size_t i = 0; i < count; ++i) {
    m_workers.emplace_back([this] { workerLoop(); });
  }
  logInfo("WorkerPool", "Started ", count, " worker threads, queue limit ",
          m_maxQueued);
}

WorkerPool::~WorkerPool() { shutdown(); }

bool WorkerPool::enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_stopping) {
      return false;
    }

    // Queued jobs first go to idle threads; only the excess counts as waiting
    std::size_t idle = m_workers.size() - m_active;
    if (m_jobs.size() >= m_maxQueued + idle) {
      return false;
    }

    m_jobs.push(std::move(job));
  }

  m_condition.notify_one();
  return true;
}

void WorkerPool::workerLoop() {
  while (true) {
    std::function<void()> job;

    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_condition.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });

      if (m_stopping && m_jobs.empty()) {
        return;
      }

      job = std::move(m_jobs.front());
      m_jobs.pop();
      ++m_active;
    }

    // packaged_task stores exceptions in its future
    job();

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      --m_active;
    }
  }
}

void WorkerPool::shutdown() {
  std::vector<std::thread> workers;
  {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_stopping) {
      // Another caller owns the join; return once it is done
      m_joinedCondition.wait(lock, [this] { return m_joined; });
      return;
    }
    m_stopping = true;
    workers.swap(m_workers);
  }

  m_condition.notify_all();

  for (std::thread &worker : workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_joined = true;
  }
  m_joinedCondition.notify_all();

  logInfo("WorkerPool", "Stopped ", workers.size(), " worker threads");
}

bool WorkerPool::isRunning() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return !m_stopping;
}

std::size_t WorkerPool::threadCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_workers.size();
}

std::size_t WorkerPool::maxQueued() const { return m_maxQueued; }

std::size_t WorkerPool::queuedJobs() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_jobs.size();
}

std::size_t WorkerPool::activeJobs() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_active;
}

} // namespace scantext
