// schemaflow/driver/worker_pool.hpp - Parallel per-file task runner
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace schemaflow
{

/// Worker count for `requested` (0 = one per hardware thread), never above `tasks`.
[[nodiscard]] inline size_t effective_jobs(size_t requested, size_t tasks) noexcept
{
  size_t jobs = requested;
  if (jobs == 0) {
    jobs = std::max<size_t>(1, std::thread::hardware_concurrency());
  }
  return std::max<size_t>(1, std::min(jobs, tasks));
}

/// Threads joined on destruction, so unwinding never destroys a joinable thread.
class JoiningThreads
{
public:
  JoiningThreads() = default;
  ~JoiningThreads() { join_all(); }

  JoiningThreads(const JoiningThreads &) = delete;
  JoiningThreads & operator=(const JoiningThreads &) = delete;

  void reserve(size_t n) { threads_.reserve(n); }

  template <typename Fn>
  void spawn(Fn && fn)
  {
    threads_.emplace_back(std::forward<Fn>(fn));
  }

  void join_all()
  {
    for (auto & t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
  }

  [[nodiscard]] size_t size() const noexcept { return threads_.size(); }

private:
  std::vector<std::thread> threads_;
};

/**
 * Run `task(i)` for every i in [0, count) on up to `jobs` threads.
 *
 * Workers pull indices from a shared atomic counter, so each index runs
 * exactly once. Tasks must only touch state owned by their index. The
 * first exception thrown by any task stops further scheduling and is
 * rethrown on the calling thread after every worker has joined.
 */
template <typename Task>
void parallel_for(size_t count, size_t jobs, Task && task)
{
  if (count == 0) {
    return;
  }

  const size_t workers = effective_jobs(jobs, count);
  if (workers == 1) {
    for (size_t i = 0; i < count; ++i) {
      task(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::atomic<bool> failed{false};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    while (!failed.load(std::memory_order_relaxed)) {
      const size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= count) {
        return;
      }
      try {
        task(i);
      } catch (...) {
        const std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
        failed.store(true, std::memory_order_relaxed);
      }
    }
  };

  JoiningThreads threads;
  threads.reserve(workers);
  try {
    for (size_t w = 0; w < workers; ++w) {
      threads.spawn(worker);
    }
  } catch (const std::system_error &) {
    // Started workers stop after their current task and are joined on unwind.
    failed.store(true, std::memory_order_relaxed);
    throw;
  }
  threads.join_all();

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace schemaflow
