#pragma once

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <tuple>
#include <type_traits>
#include <vector>

#include <numa.h>
#include <pthread.h>
#include <sched.h>

#include "common/macros.h"

namespace Common {

/// Set affinity for current thread to be pinned to the provided core_id
inline auto setThreadCore(int core_id) noexcept -> bool {
  if (core_id < 0) return false;
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(static_cast<size_t>(core_id), &cpuset);
  return pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset) == 0;
}

/// Set preferred NUMA node for memory allocated by the current thread
inline auto setNumaNode(int node_id) noexcept -> bool {
  if (node_id < 0 || numa_available() < 0) {
    return false;
  }
  numa_set_preferred(node_id);
  return true;
}

/// Names the current thread (truncated to the 15 chars pthread allows)
inline void setThreadName(const char* name) noexcept {
  char truncated[16];
  std::strncpy(truncated, name, sizeof(truncated) - 1);
  truncated[sizeof(truncated) - 1] = '\0';
  pthread_setname_np(pthread_self(), truncated);
}

/// Fixed-size worker pool over a mutex-guarded task deque.
///
/// Workers may be pinned to cores and given a preferred NUMA node. Both are
/// best-effort: a worker that cannot be pinned still runs tasks.
class ThreadPool {
public:
  static constexpr size_t MAX_THREADS = 64;

  /// core_ids may be nullptr; otherwise it holds num_workers entries (-1 = unpinned)
  explicit ThreadPool(size_t num_workers, int numa_node = -1, const int* core_ids = nullptr)
    : stopped_{false} {
    if (num_workers == 0) num_workers = 1;
    if (num_workers > MAX_THREADS) num_workers = MAX_THREADS;
    workers_.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
      const int core_id = core_ids != nullptr ? core_ids[i] : -1;
      workers_.emplace_back([this, core_id, numa_node] { workerLoop(core_id, numa_node); });
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  ~ThreadPool() {
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      stopped_.store(true, std::memory_order_release);
    }
    condition_.notify_all();
    for (auto& worker : workers_) {
      if (worker.joinable()) {
        worker.join();
      }
    }
  }

  template<typename F, typename... Args>
  auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    using R = std::invoke_result_t<F, Args...>;

    auto task = std::make_shared<std::packaged_task<R()>>(
      [fn = std::forward<F>(f),
       args_tuple = std::make_tuple(std::forward<Args>(args)...)]() mutable -> R {
        return std::apply(std::move(fn), std::move(args_tuple));
      });
    auto res = task->get_future();

    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      if (stopped_.load(std::memory_order_acquire)) {
        std::promise<R> error_promise;
        error_promise.set_exception(std::make_exception_ptr(
          std::runtime_error("enqueue on stopped ThreadPool")));
        return error_promise.get_future();
      }
      tasks_.emplace_back([task]() { (*task)(); });
    }

    condition_.notify_one();
    return res;
  }

  [[nodiscard]] auto size() const noexcept -> size_t { return workers_.size(); }

  [[nodiscard]] auto is_stopped() const noexcept -> bool {
    return stopped_.load(std::memory_order_acquire);
  }

private:
  void workerLoop(int core_id, int numa_node) {
    if (core_id >= 0) {
      (void)setThreadCore(core_id);
    }
    if (numa_node >= 0) {
      (void)setNumaNode(numa_node);
    }
    setThreadName("audit-worker");

    while (true) {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        condition_.wait(lock, [this] {
          return stopped_.load(std::memory_order_acquire) || !tasks_.empty();
        });
        if (stopped_.load(std::memory_order_acquire) && tasks_.empty()) {
          break;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
      }
      task();
    }
  }

  std::vector<std::thread> workers_;
  std::deque<std::function<void()>> tasks_;
  std::mutex queue_mutex_;
  std::condition_variable condition_;
  std::atomic<bool> stopped_;
};

} // namespace Common
