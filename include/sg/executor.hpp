/**
 * @file executor.hpp
 * @brief Executor concept and the deterministic ManualExecutor.
 *
 * An executor is any type providing:
 * @code
 *   bool Post(sg::Task&& task) noexcept;
 * @endcode
 * Post() hands the task to some thread and returns false when the task is
 * refused (stopped, queue full). It must never run the task inline on the
 * posting thread. ScatterGather() takes the executor by reference per run;
 * there is no global scheduler.
 *
 * ManualExecutor queues posted tasks and runs them only when the owner calls
 * RunOne()/RunNewest()/RunAll(), which makes admission and completion order
 * fully reproducible in tests.
 *
 * Usage:
 * @code
 *   sg::ManualExecutor exec;
 *   auto run = sg::ScatterGather(exec, items, opts, unit, 0, combine);
 *   exec.RunAll();
 *   REQUIRE(run.value().IsDone());
 * @endcode
 */

#ifndef SG_EXECUTOR_HPP_
#define SG_EXECUTOR_HPP_

#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>

#include <deque>
#include <mutex>

namespace sg {

// ============================================================================
// Task
// ============================================================================

static constexpr size_t kTaskBufferSize = 64U;

/// @brief Unit of work accepted by every executor.
using Task = FixedFunction<void(), kTaskBufferSize>;

// ============================================================================
// ManualExecutor
// ============================================================================

struct ManualExecutorStats {
  uint64_t posted{0U};
  uint64_t executed{0U};
  uint64_t rejected{0U};
};

/**
 * @brief Executor whose tasks run only when explicitly stepped.
 *
 * Thread-safe: Post() may be called from any thread, including from inside a
 * task being run by RunOne().
 */
class ManualExecutor final {
 public:
  ManualExecutor() noexcept = default;
  ~ManualExecutor() = default;

  ManualExecutor(const ManualExecutor&) = delete;
  ManualExecutor& operator=(const ManualExecutor&) = delete;
  ManualExecutor(ManualExecutor&&) = delete;
  ManualExecutor& operator=(ManualExecutor&&) = delete;

  bool Post(Task&& task) noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    if (rejecting_) {
      ++stats_.rejected;
      return false;
    }
    queue_.push_back(std::move(task));
    ++stats_.posted;
    return true;
  }

  /// @brief Run the oldest pending task.
  /// @return false if nothing was pending.
  bool RunOne() noexcept { return RunFrom(true); }

  /// @brief Run the most recently posted task (reverses completion order).
  bool RunNewest() noexcept { return RunFrom(false); }

  /**
   * @brief Run tasks in FIFO order until the queue is empty.
   *
   * Tasks posted by running tasks are executed too.
   * @param max_tasks Upper bound on tasks to run.
   * @return Number of tasks executed.
   */
  uint32_t RunAll(uint32_t max_tasks = UINT32_MAX) noexcept {
    uint32_t n = 0U;
    while (n < max_tasks && RunOne()) {
      ++n;
    }
    return n;
  }

  uint32_t Pending() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return static_cast<uint32_t>(queue_.size());
  }

  /// @brief While set, Post() refuses every task.
  void SetRejecting(bool rejecting) noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    rejecting_ = rejecting;
  }

  ManualExecutorStats GetStats() const noexcept {
    std::lock_guard<std::mutex> lk(mtx_);
    return stats_;
  }

 private:
  bool RunFrom(bool front) noexcept {
    Task task;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (queue_.empty()) {
        return false;
      }
      if (front) {
        task = std::move(queue_.front());
        queue_.pop_front();
      } else {
        task = std::move(queue_.back());
        queue_.pop_back();
      }
      ++stats_.executed;
    }
    task();
    return true;
  }

  mutable std::mutex mtx_;
  std::deque<Task> queue_;
  bool rejecting_{false};
  ManualExecutorStats stats_;
};

}  // namespace sg

#endif  // SG_EXECUTOR_HPP_
