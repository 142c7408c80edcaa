/**
 * @file ThreadPool.cpp
 * @brief Worker pool implementation
 */

#include "ThreadPool.h"

#include <algorithm>
#include <exception>

namespace tractoscore {

ThreadPool::ThreadPool(size_t num_threads) : m_stop(false) {
  if (num_threads == 0) {
    num_threads = std::thread::hardware_concurrency();
    if (num_threads == 0)
      num_threads = 4; // Fallback
  }

  for (size_t i = 0; i < num_threads; ++i) {
    m_workers.emplace_back([this] {
      for (;;) {
        std::function<void()> task;

        {
          std::unique_lock<std::mutex> lock(this->m_queue_mutex);
          this->m_condition.wait(
              lock, [this] { return this->m_stop || !this->m_tasks.empty(); });

          if (this->m_stop && this->m_tasks.empty()) {
            return;
          }

          task = std::move(this->m_tasks.front());
          this->m_tasks.pop();
        }

        task();
      }
    });
  }
}

ThreadPool::~ThreadPool() {
  {
    std::unique_lock<std::mutex> lock(m_queue_mutex);
    m_stop = true;
  }

  m_condition.notify_all();

  for (std::thread &worker : m_workers) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void ParallelFor(size_t count, size_t num_threads,
                 const std::function<void(size_t, size_t)> &body) {
  if (count == 0)
    return;

  if (num_threads <= 1 || count == 1) {
    body(0, count);
    return;
  }

  const size_t workers = std::min(num_threads, count);
  const size_t chunk = (count + workers - 1) / workers;

  ThreadPool pool(workers);
  std::vector<std::future<void>> pending;
  pending.reserve(workers);

  for (size_t begin = 0; begin < count; begin += chunk) {
    const size_t end = std::min(count, begin + chunk);
    pending.push_back(pool.Enqueue(body, begin, end));
  }

  // Wait for every chunk before surfacing a failure
  std::exception_ptr first_error;
  for (auto &future : pending) {
    try {
      future.get();
    } catch (...) {
      if (!first_error)
        first_error = std::current_exception();
    }
  }

  if (first_error)
    std::rethrow_exception(first_error);
}

} // namespace tractoscore
