#ifndef DISCOFILL_UTIL_THREADPOOL_HPP
#define DISCOFILL_UTIL_THREADPOOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace discofill {
namespace util {

/**
 * Worker pool for work that must stay off the orchestrator thread
 * (catalog paging, host analysis triggers).
 *
 * Usage:
 *   ThreadPool pool("catalog", 2);
 *   auto future = pool.enqueue([](){ return 42; });
 *   pool.post([](){ ... });   // fire-and-forget
 */
class ThreadPool {
public:
  /**
   * Create pool with the given number of threads
   * If num_threads == 0, uses hardware concurrency
   */
  explicit ThreadPool(std::string name, size_t num_threads = 0);

  /**
   * Destructor - runs the queued tasks, then joins
   */
  ~ThreadPool();

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;

  /**
   * Enqueue a task for execution
   * Returns a future that will contain the result (or the exception)
   * Throws std::runtime_error after shutdown()
   */
  template <class F, class... Args>
  auto enqueue(F &&f, Args &&...args)
      -> std::future<typename std::invoke_result<F, Args...>::type>;

  /**
   * Fire-and-forget: exceptions escaping the task are logged, not rethrown
   * Returns false if the pool has been shut down
   */
  bool post(std::function<void()> task);

  /**
   * Stop accepting work, drain the queue and join the workers
   * Safe to call more than once
   */
  void shutdown();

  size_t size() const { return workers_.size(); }
  const std::string &name() const { return name_; }

private:
  void worker_loop();

  std::string name_;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;

  std::mutex queue_mutex_;
  std::condition_variable condition_;
  bool stop_;
};

// Implementation of enqueue (must be in header for template)
template <class F, class... Args>
auto ThreadPool::enqueue(F &&f, Args &&...args)
    -> std::future<typename std::invoke_result<F, Args...>::type> {
  using return_type = typename std::invoke_result<F, Args...>::type;

  auto task = std::make_shared<std::packaged_task<return_type()>>(
      std::bind(std::forward<F>(f), std::forward<Args>(args)...));

  std::future<return_type> res = task->get_future();
  {
    std::unique_lock<std::mutex> lock(queue_mutex_);

    if (stop_)
      throw std::runtime_error("enqueue on stopped ThreadPool '" + name_ + "'");

    tasks_.emplace([task]() { (*task)(); });
  }
  condition_.notify_one();
  return res;
}

} // namespace util
} // namespace discofill

#endif // DISCOFILL_UTIL_THREADPOOL_HPP
