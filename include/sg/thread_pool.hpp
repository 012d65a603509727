/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file sg/thread_pool.hpp
 * @brief ThreadPool - fixed set of worker threads with per-worker task queues.
 *
 * Architecture:
 *   Post(Task) --(worker mutex)--> Worker[i] TaskRing -> WorkerThread -> task()
 *
 * Worker selection for each Post():
 *   1. an idle worker with an empty queue (scan from a round-robin cursor);
 *   2. the posting worker's own queue, when called from a pool thread and
 *      that queue is empty (the caller is about to become free);
 *   3. the first queue with free space, round-robin.
 * Post() returns false when the pool is stopped or every queue is full.
 *
 * Features:
 * - Bounded per-worker task rings (no allocation after Start)
 * - Adaptive spin -> yield -> condition_variable wait in workers
 * - WaitIdle() for draining all posted work
 * - Thread priority and CPU affinity support (Linux)
 * - Busy/peak-busy statistics to observe pool saturation
 *
 * The pool size is independent of any run's concurrency limit: a run limits
 * how many units it admits, the pool limits how many execute at once.
 *
 * Usage:
 *   sg::ThreadPoolConfig cfg;
 *   cfg.name = "backend";
 *   cfg.worker_num = 8;
 *
 *   sg::ThreadPool pool(cfg);
 *   pool.Start();
 *   pool.Post([] { ... });
 *   pool.Shutdown();
 */

#ifndef SG_THREAD_POOL_HPP_
#define SG_THREAD_POOL_HPP_

#include "sg/executor.hpp"
#include "sg/log.hpp"
#include "sg/platform.hpp"
#include "sg/vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace sg {

namespace detail {

/**
 * @brief Bounded exponential spin used by idle workers before they block.
 *
 * Each Spin() doubles the number of pause instructions (1, 2, 4 .. 32) and
 * returns false after the last round; the worker then waits on its
 * condition variable.
 */
class IdleSpinner {
 public:
  void Reset() noexcept { round_ = 0U; }

  bool Spin() noexcept {
    if (round_ >= kRounds) {
      return false;
    }
    for (uint32_t i = 0U; i < (1U << round_); ++i) {
      CpuRelax();
    }
    ++round_;
    return true;
  }

 private:
  static constexpr uint32_t kRounds = 6U;
  uint32_t round_{0U};
};

/// @brief Identity of the pool worker running on the current thread, if any.
struct WorkerIdentity {
  const void* pool{nullptr};
  uint32_t worker_id{0U};
};

inline WorkerIdentity& CurrentWorker() noexcept {
  static thread_local WorkerIdentity identity;
  return identity;
}

}  // namespace detail

// ============================================================================
// Configuration
// ============================================================================

static constexpr uint32_t kDefaultWorkerQueueDepth = 1024U;
/// Upper bounds applied by the ThreadPool constructor.
static constexpr uint32_t kMaxWorkerQueueDepth = 1U << 16U;
static constexpr uint32_t kMaxPoolWorkers = 256U;

struct ThreadPoolConfig {
  FixedString<32> name{"pool"};
  uint32_t worker_num{1U};
  uint32_t worker_queue_depth{kDefaultWorkerQueueDepth};
  int32_t priority{0};
#ifdef __linux__
  uint32_t cpu_set_size{0U};
  const cpu_set_t* cpu_set{nullptr};
#endif
};

// ============================================================================
// TaskRing - per-worker bounded ring
// ============================================================================

/**
 * @brief Power-of-two ring with one consumer (the owning worker) and
 *        producers serialized by the worker mutex.
 *
 * head_ and tail_ are free-running counters; their difference is the fill
 * level. Empty() may be read from any thread as a hint.
 */
template <typename T>
class TaskRing {
 public:
  /// @param min_capacity At most 2^31; allocates the slots up front.
  explicit TaskRing(uint32_t min_capacity)
      : slots_(RoundUpPow2(min_capacity)), mask_(static_cast<uint32_t>(slots_.size()) - 1U) {}

  TaskRing(const TaskRing&) = delete;
  TaskRing& operator=(const TaskRing&) = delete;

  /// @return false when full; `item` is then left as it was.
  bool TryPush(T&& item) noexcept {
    const uint32_t tail = tail_.load(std::memory_order_relaxed);
    if (tail - head_.load(std::memory_order_acquire) > mask_) {
      return false;
    }
    slots_[tail & mask_] = std::move(item);
    tail_.store(tail + 1U, std::memory_order_release);
    return true;
  }

  bool TryPop(T& out) noexcept {
    const uint32_t head = head_.load(std::memory_order_relaxed);
    if (head == tail_.load(std::memory_order_acquire)) {
      return false;
    }
    out = std::move(slots_[head & mask_]);
    head_.store(head + 1U, std::memory_order_release);
    return true;
  }

  bool Empty() const noexcept { return Size() == 0U; }

  uint32_t Size() const noexcept {
    return tail_.load(std::memory_order_acquire) - head_.load(std::memory_order_acquire);
  }

  uint32_t Capacity() const noexcept { return mask_ + 1U; }

 private:
  static uint32_t RoundUpPow2(uint32_t n) noexcept {
    uint32_t cap = 1U;
    while (cap < n) {
      cap <<= 1U;
    }
    return cap;
  }

  std::vector<T> slots_;
  const uint32_t mask_;
  alignas(kCacheLineSize) std::atomic<uint32_t> tail_{0U};
  alignas(kCacheLineSize) std::atomic<uint32_t> head_{0U};
};

// ============================================================================
// ThreadPool Statistics
// ============================================================================

struct ThreadPoolStats {
  uint64_t posted{0U};
  uint64_t processed{0U};
  uint64_t rejected{0U};
  uint32_t busy_workers{0U};
  uint32_t peak_busy_workers{0U};
};

// ============================================================================
// ThreadPool
// ============================================================================

class ThreadPool final {
 public:
  explicit ThreadPool(const ThreadPoolConfig& cfg) noexcept
      : name_(cfg.name),
        worker_num_(ClampSetting(cfg.worker_num, 1U, kMaxPoolWorkers, "worker_num")),
        priority_(cfg.priority),
#ifdef __linux__
        cpu_set_size_(cfg.cpu_set_size),
        cpu_set_(cfg.cpu_set),
#endif
        worker_queue_depth_(ClampSetting(cfg.worker_queue_depth, kDefaultWorkerQueueDepth,
                                         kMaxWorkerQueueDepth, "worker_queue_depth")) {
  }

  ~ThreadPool() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      Shutdown();
    }
  }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&) = delete;
  ThreadPool& operator=(ThreadPool&&) = delete;

  // ======================== Lifecycle ========================

  /**
   * @brief Create the worker queues and start N worker threads.
   */
  void Start() noexcept {
    if (running_.load(std::memory_order_acquire)) {
      return;
    }
    shutdown_.store(false, std::memory_order_release);

    workers_.reserve(worker_num_);
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      workers_.push_back(std::make_unique<WorkerContext>(worker_queue_depth_));
    }
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      worker_threads_.emplace_back(&ThreadPool::WorkerLoop, this, i);
    }

    running_.store(true, std::memory_order_release);
    accepting_.store(true);
    SG_LOG_INFO("Pool", "'%s' started: workers=%u queue_depth=%u", name_.c_str(), worker_num_,
                worker_queue_depth_);
  }

  /**
   * @brief Stop accepting tasks, drain queued tasks, join all threads.
   *
   * Tasks still queued are executed; tasks they post are rejected.
   */
  void Shutdown() noexcept {
    if (!running_.load(std::memory_order_acquire)) {
      return;
    }
    accepting_.store(false);
    while (posters_.load() != 0U) {
      std::this_thread::yield();
    }
    shutdown_.store(true, std::memory_order_release);

    for (uint32_t i = 0U; i < worker_num_; ++i) {
      {
        std::lock_guard<std::mutex> lk(workers_[i]->mtx);
      }
      workers_[i]->cv.notify_one();
    }

    for (auto& t : worker_threads_) {
      if (t.joinable()) {
        t.join();
      }
    }

    workers_.clear();
    worker_threads_.clear();
    running_.store(false, std::memory_order_release);
    SG_LOG_INFO("Pool", "'%s' stopped: posted=%lu processed=%lu rejected=%lu", name_.c_str(),
                static_cast<unsigned long>(posted_.load(std::memory_order_relaxed)),
                static_cast<unsigned long>(processed_.load(std::memory_order_relaxed)),
                static_cast<unsigned long>(rejected_.load(std::memory_order_relaxed)));
  }

  /**
   * @brief Block until every posted task has finished or the timeout expires.
   * @param timeout_us Maximum wait in microseconds.
   * @return true if the pool went idle.
   */
  bool WaitIdle(uint64_t timeout_us) const noexcept {
    const uint64_t deadline = SteadyNowUs() + timeout_us;
    while (processed_.load(std::memory_order_acquire) != posted_.load(std::memory_order_acquire)) {
      if (SteadyNowUs() >= deadline) {
        return false;
      }
      std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
    return true;
  }

  // ======================== Post API ========================

  /**
   * @brief Queue a task on one of the workers.
   *
   * @return true if queued, false if the pool is not accepting or all
   *         worker queues are full (the task is then left untouched).
   */
  bool Post(Task&& task) noexcept {
    posters_.fetch_add(1U);
    if (!accepting_.load()) {
      posters_.fetch_sub(1U, std::memory_order_release);
      rejected_.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }

    const bool ok = PostToWorker(task);
    posters_.fetch_sub(1U, std::memory_order_release);
    if (!ok) {
      rejected_.fetch_add(1U, std::memory_order_relaxed);
    }
    return ok;
  }

  // ======================== Query ========================

  ThreadPoolStats GetStats() const noexcept {
    ThreadPoolStats s;
    s.posted = posted_.load(std::memory_order_relaxed);
    s.processed = processed_.load(std::memory_order_relaxed);
    s.rejected = rejected_.load(std::memory_order_relaxed);
    s.busy_workers = busy_.load(std::memory_order_relaxed);
    s.peak_busy_workers = peak_busy_.load(std::memory_order_relaxed);
    return s;
  }

  uint32_t WorkerCount() const noexcept { return worker_num_; }

  /// @brief Per-worker queue depth as configured, after clamping.
  uint32_t QueueDepth() const noexcept { return worker_queue_depth_; }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  const char* Name() const noexcept { return name_.c_str(); }

 private:
  struct WorkerContext;

  // 0 selects `fallback`; anything above `max` is capped.
  static uint32_t ClampSetting(uint32_t value, uint32_t fallback, uint32_t max,
                               const char* what) noexcept {
    if (value == 0U) {
      return fallback;
    }
    if (value > max) {
      SG_LOG_WARN("Pool", "%s %u capped to %u", what, value, max);
      return max;
    }
    return value;
  }

  // ======================== Worker selection ========================

  bool PostToWorker(Task& task) noexcept {
    const uint32_t start = next_worker_.fetch_add(1U, std::memory_order_relaxed) % worker_num_;

    // Pass 1: an idle worker with nothing queued.
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      const uint32_t wid = (start + i) % worker_num_;
      WorkerContext& ctx = *workers_[wid];
      if (ctx.busy.load(std::memory_order_acquire) || !ctx.queue.Empty()) {
        continue;
      }
      if (PushTo(wid, task)) {
        return true;
      }
    }

    // Pass 2: our own queue when posting from a worker of this pool.
    const detail::WorkerIdentity& self = detail::CurrentWorker();
    if (self.pool == this && workers_[self.worker_id]->queue.Empty()) {
      if (PushTo(self.worker_id, task)) {
        return true;
      }
    }

    // Pass 3: any queue with free space.
    for (uint32_t i = 0U; i < worker_num_; ++i) {
      if (PushTo((start + i) % worker_num_, task)) {
        return true;
      }
    }
    return false;
  }

  bool PushTo(uint32_t wid, Task& task) noexcept {
    WorkerContext& ctx = *workers_[wid];
    {
      std::lock_guard<std::mutex> lk(ctx.mtx);
      if (!ctx.queue.TryPush(std::move(task))) {
        return false;
      }
      posted_.fetch_add(1U, std::memory_order_release);
    }
    ctx.cv.notify_one();
    return true;
  }

  // ======================== Worker thread ========================

  void WorkerLoop(uint32_t worker_id) noexcept {
    ApplyThreadPolicy(worker_id);
    detail::CurrentWorker().pool = this;
    detail::CurrentWorker().worker_id = worker_id;

    WorkerContext& ctx = *workers_[worker_id];
    Task task;
    detail::IdleSpinner spinner;

    while (!shutdown_.load(std::memory_order_acquire)) {
      if (ctx.queue.TryPop(task)) {
        RunTask(ctx, task);
        spinner.Reset();
      } else if (!spinner.Spin()) {
        std::unique_lock<std::mutex> lk(ctx.mtx);
        ctx.cv.wait_for(lk, std::chrono::milliseconds(1), [this, &ctx] {
          return !ctx.queue.Empty() || shutdown_.load(std::memory_order_acquire);
        });
        spinner.Reset();
      }
    }

    // queued before Shutdown(): still runs
    while (ctx.queue.TryPop(task)) {
      RunTask(ctx, task);
    }
    detail::CurrentWorker().pool = nullptr;
  }

  void RunTask(WorkerContext& ctx, Task& task) noexcept {
    ctx.busy.store(true, std::memory_order_release);
    const uint32_t busy = busy_.fetch_add(1U, std::memory_order_acq_rel) + 1U;
    uint32_t peak = peak_busy_.load(std::memory_order_relaxed);
    while (busy > peak && !peak_busy_.compare_exchange_weak(peak, busy, std::memory_order_relaxed)) {
    }

    task();
    task = nullptr;  // release captured state before reporting idle

    busy_.fetch_sub(1U, std::memory_order_acq_rel);
    ctx.busy.store(false, std::memory_order_release);
    processed_.fetch_add(1U, std::memory_order_release);
  }

  // ======================== Platform helpers ========================

  // Scheduling class and affinity for the calling worker. Failures (usually
  // missing privileges) are logged and the worker keeps the default policy.
  void ApplyThreadPolicy(uint32_t worker_id) const noexcept {
#ifdef __linux__
    if (priority_ != 0) {
      struct sched_param param{};
      int policy = SCHED_IDLE;
      if (priority_ > 0) {
        policy = SCHED_FIFO;
        param.sched_priority = priority_ > 99 ? 99 : priority_;
      }
      const int rc = pthread_setschedparam(pthread_self(), policy, &param);
      if (rc != 0) {
        SG_LOG_WARN("Pool", "'%s' worker %u: priority %d not applied (errno %d)", name_.c_str(),
                    worker_id, static_cast<int>(priority_), rc);
      }
    }
    if (cpu_set_ != nullptr && cpu_set_size_ > 0U) {
      const int rc = pthread_setaffinity_np(pthread_self(), cpu_set_size_, cpu_set_);
      if (rc != 0) {
        SG_LOG_WARN("Pool", "'%s' worker %u: affinity not applied (errno %d)", name_.c_str(),
                    worker_id, rc);
      }
    }
#else
    (void)worker_id;
#endif
  }

  // ======================== Worker context ========================

  struct WorkerContext {
    TaskRing<Task> queue;
    std::mutex mtx;
    std::condition_variable cv;
    std::atomic<bool> busy{false};

    explicit WorkerContext(uint32_t depth) : queue(depth) {}
    WorkerContext(const WorkerContext&) = delete;
    WorkerContext& operator=(const WorkerContext&) = delete;
    WorkerContext(WorkerContext&&) = delete;
    WorkerContext& operator=(WorkerContext&&) = delete;
  };

  // ======================== Data members ========================

  FixedString<32> name_;
  const uint32_t worker_num_;
  const int32_t priority_;
#ifdef __linux__
  const uint32_t cpu_set_size_{0U};
  const cpu_set_t* cpu_set_{nullptr};
#endif
  const uint32_t worker_queue_depth_;

  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<bool> shutdown_{false};
  std::atomic<uint32_t> posters_{0U};

  alignas(sg::kCacheLineSize) std::atomic<uint64_t> posted_{0U};
  alignas(sg::kCacheLineSize) std::atomic<uint64_t> processed_{0U};
  alignas(sg::kCacheLineSize) std::atomic<uint64_t> rejected_{0U};
  alignas(sg::kCacheLineSize) std::atomic<uint32_t> busy_{0U};
  std::atomic<uint32_t> peak_busy_{0U};
  alignas(sg::kCacheLineSize) std::atomic<uint32_t> next_worker_{0U};

  std::vector<std::unique_ptr<WorkerContext>> workers_;
  std::vector<std::thread> worker_threads_;
};

}  // namespace sg

#endif  // SG_THREAD_POOL_HPP_
