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
 * @file timer.hpp
 * @brief Fixed-capacity deadline scheduler driven by one background thread.
 *
 * Entries are one-shot deadlines; actors use them to deliver receive
 * timeouts. Callbacks run on the
 * scheduler thread with the internal lock released, so a callback may add or
 * remove entries.
 */

#ifndef CFX_TIMER_HPP_
#define CFX_TIMER_HPP_

#include "cfx/log.hpp"
#include "cfx/platform.hpp"
#include "cfx/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace cfx {

using TimerCallback = std::function<void()>;

/**
 * @brief Slot-array timer scheduler.
 *
 *   cfx::TimerScheduler timers(8);
 *   timers.Start();
 *   timers.AddOneShot(50, [] { Expire(); });
 *   timers.Stop();
 *
 * Non-copyable, non-movable.
 */
class TimerScheduler final {
 public:
  explicit TimerScheduler(uint32_t max_tasks = 16)
      : slots_(new TaskSlot[max_tasks == 0U ? 1U : max_tasks]),
        max_tasks_(max_tasks == 0U ? 1U : max_tasks) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  /**
   * @brief Register a task firing once, @p delay_ms from now. A zero delay
   *        fires on the next scheduler pass. The slot frees itself after
   *        firing.
   * @return kSlotsFull when at capacity.
   */
  expected<TimerTaskId, TimerError> AddOneShot(uint32_t delay_ms, TimerCallback fn) {
    uint32_t id = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      uint32_t i = 0U;
      while (i < max_tasks_ && slots_[i].active) ++i;
      if (i == max_tasks_) {
        CFX_LOG_WARN("Timer", "all %u slots in use", max_tasks_);
        return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
      }
      TaskSlot& slot = slots_[i];
      slot.fn = std::move(fn);
      slot.fire_ns = SteadyNowNs() + MsToNs(delay_ms);
      slot.id = next_id_++;
      if (next_id_ == 0U) next_id_ = 1U;
      slot.active = true;
      id = slot.id;
    }
    cv_.notify_all();
    return expected<TimerTaskId, TimerError>::success(TimerTaskId(id));
  }

  /**
   * @brief Cancel a task. Fails with kNotRunning when the id is unknown or
   *        the one-shot already fired.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active && slots_[i].id == task_id.value()) {
        slots_[i].active = false;
        slots_[i].fn = nullptr;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop and join the scheduler thread. Pending entries stay queued.
   *        Must not be called from a timer callback.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept { return running_.load(std::memory_order_acquire); }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < max_tasks_; ++i) {
      if (slots_[i].active) ++count;
    }
    return count;
  }

  uint32_t Capacity() const noexcept { return max_tasks_; }

 private:
  struct TaskSlot {
    TimerCallback fn;
    uint64_t fire_ns = 0;  ///< Absolute monotonic deadline.
    uint32_t id = 0;
    bool active = false;
  };

  static uint64_t MsToNs(uint32_t ms) noexcept { return static_cast<uint64_t>(ms) * 1000000ULL; }

  void ScheduleLoop() {
    std::vector<TimerCallback> due;
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const uint64_t now = SteadyNowNs();
      uint64_t next_deadline = UINT64_MAX;

      for (uint32_t i = 0U; i < max_tasks_; ++i) {
        TaskSlot& slot = slots_[i];
        if (!slot.active) continue;
        if (now >= slot.fire_ns) {
          due.push_back(std::move(slot.fn));
          slot.fn = nullptr;
          slot.active = false;
          continue;
        }
        if (slot.fire_ns < next_deadline) next_deadline = slot.fire_ns;
      }

      if (!due.empty()) {
        lock.unlock();
        for (auto& fn : due) {
          if (fn) fn();
        }
        due.clear();
        lock.lock();
        continue;
      }

      if (next_deadline == UINT64_MAX) {
        cv_.wait(lock);
      } else {
        cv_.wait_for(lock, std::chrono::nanoseconds(next_deadline - now));
      }
    }
  }

  std::unique_ptr<TaskSlot[]> slots_;
  uint32_t max_tasks_;
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
};

}  // namespace cfx

#endif  // CFX_TIMER_HPP_
