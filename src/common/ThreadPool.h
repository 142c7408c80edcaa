/**
 * @file ThreadPool.h
 * @brief Fixed-size worker pool used to parallelize per-streamline stages
 */

#ifndef THREAD_POOL_H
#define THREAD_POOL_H

#include <atomic>
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

namespace tractoscore {

class ThreadPool {
private:
  std::vector<std::thread> m_workers;
  std::queue<std::function<void()>> m_tasks;
  std::mutex m_queue_mutex;
  std::condition_variable m_condition;
  std::atomic<bool> m_stop;

public:
  explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  template <class F, class... Args>
  auto Enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type> {
    using return_type = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));

    std::future<return_type> res = task->get_future();

    {
      std::unique_lock<std::mutex> lock(m_queue_mutex);

      // Don't allow enqueueing after stopping the pool
      if (m_stop) {
        throw std::runtime_error("enqueue on stopped ThreadPool");
      }

      m_tasks.emplace([task]() { (*task)(); });
    }

    m_condition.notify_one();
    return res;
  }

  size_t GetNumThreads() const { return m_workers.size(); }
};

/**
 * @brief Run body(begin, end) over [0, count) split into contiguous chunks
 *
 * With num_threads <= 1 the body runs inline on the calling thread. Each
 * chunk writes only to its own index range, so results are independent of
 * the thread count. The first exception thrown by a chunk is rethrown after
 * all chunks have finished.
 */
void ParallelFor(size_t count, size_t num_threads,
                 const std::function<void(size_t, size_t)> &body);

} // namespace tractoscore

#endif // THREAD_POOL_H
