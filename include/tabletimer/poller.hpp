#pragma once
#include "tabletimer/steady_clock.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace tabletimer {

// Single-threaded event loop. Every timer callback and every posted task
// runs on the thread that calls poll()/start(), one after the other.
struct Poller {
  using TimerID = uint32_t;
  using TimerCallback = std::function<void()>;
  using Task = std::function<void()>;

  struct TimerEntry {
    TimerID id;
    SteadyClock::TimePoint expiry_time;
    uint32_t interval_ms;
    TimerCallback callback;
    bool is_interval;
  };

  // Maximum time a blocking poll() waits when no timer is due sooner
  int max_poll_timeout_ms = 1000;

  // Constructor
  explicit Poller(SteadyClock::NowFunction now_function = SteadyClock::now);

  // Destructor
  ~Poller();

  Poller(const Poller &) = delete;
  Poller &operator=(const Poller &) = delete;

  // One loop iteration: wait up to timeout_ms for a wake-up, then run
  // posted tasks and due timers. Returns the number of callbacks run.
  size_t poll(int timeout_ms);

  // Blocking loop until stop()
  void start();
  void stop();
  bool isRunning() const { return running.load(); }

  // Thread-safe: queue a task for the loop thread and wake it up
  void post(Task task);

  // Wake up a blocking poll() from another thread
  void notify();

  // Timer methods
  TimerID setTimeout(uint32_t ms, TimerCallback callback);
  TimerID setInterval(uint32_t ms, TimerCallback callback);
  void clearTimeout(TimerID timer_id);
  void clearInterval(TimerID timer_id);
  bool hasTimer(TimerID timer_id) const;
  size_t timerCount() const { return timers.size(); }

  SteadyClock::TimePoint now() const { return now_function(); }

protected:
  TimerID addTimer(uint32_t ms, TimerCallback callback, bool is_interval);

  // Timer helper methods
  int calculatePollTimeout(int timeout_ms) const;
  size_t processExpiredTimers();
  size_t processPostedTasks();

  // Pipe helper methods
  bool createNotificationPipe();
  void closeNotificationPipe();
  bool hasNotificationPipe() const;
  void drainNotificationPipe();

private:
  SteadyClock::NowFunction now_function;

  TimerID next_timer_id = 1;
  std::map<TimerID, TimerEntry> timers;

  mutable std::mutex task_mutex; // Make mutable for const methods
  std::vector<Task> posted_tasks;

  std::atomic<bool> running{false};

  // Notification pipe for breaking poll() calls
  int notification_pipe[2] = {-1, -1};
};

} // namespace tabletimer
