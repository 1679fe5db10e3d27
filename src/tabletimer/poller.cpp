#include "tabletimer/poller.hpp"
#include "tabletimer/log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>
#include <utility>

namespace tabletimer {

Poller::Poller(SteadyClock::NowFunction now_function)
    : now_function(std::move(now_function)) {
  if (!createNotificationPipe()) {
    LOG_ERROR("Failed to create poller notification pipe: ", strerror(errno));
  }
}

Poller::~Poller() { closeNotificationPipe(); }

size_t Poller::poll(int timeout_ms) {
  int wait_ms = calculatePollTimeout(timeout_ms);

  if (hasNotificationPipe()) {
    pollfd notification_pfd;
    notification_pfd.fd = notification_pipe[0];
    notification_pfd.events = POLLIN;
    notification_pfd.revents = 0;

    int result = ::poll(&notification_pfd, 1, wait_ms);
    if (result < 0 && errno != EINTR) {
      LOG_ERROR("Poll error: ", strerror(errno));
    } else if (result > 0 && (notification_pfd.revents & POLLIN)) {
      drainNotificationPipe();
    }
  }

  size_t handled = processPostedTasks();
  handled += processExpiredTimers();
  return handled;
}

void Poller::start() {
  running.store(true);

  while (running.load()) {
    poll(-1);
  }
}

void Poller::stop() {
  running.store(false);
  notify();
}

void Poller::post(Task task) {
  {
    std::lock_guard<std::mutex> lock(task_mutex);
    posted_tasks.push_back(std::move(task));
  }
  notify();
}

void Poller::notify() {
  // Write a byte to the notification pipe to wake up poll()
  if (hasNotificationPipe()) {
    char byte = 1;
    if (write(notification_pipe[1], &byte, 1) == -1 && errno != EAGAIN) {
      LOG_ERROR("Failed to wake poller: ", strerror(errno));
    }
  }
}

// Timer implementation
Poller::TimerID Poller::setTimeout(uint32_t ms, TimerCallback callback) {
  return addTimer(ms, std::move(callback), false);
}

Poller::TimerID Poller::setInterval(uint32_t ms, TimerCallback callback) {
  // A zero interval would keep the timer permanently due
  return addTimer(std::max<uint32_t>(ms, 1), std::move(callback), true);
}

void Poller::clearTimeout(TimerID timer_id) { timers.erase(timer_id); }

void Poller::clearInterval(TimerID timer_id) { timers.erase(timer_id); }

bool Poller::hasTimer(TimerID timer_id) const {
  return timers.find(timer_id) != timers.end();
}

Poller::TimerID Poller::addTimer(uint32_t ms, TimerCallback callback,
                                 bool is_interval) {
  TimerID id = next_timer_id++;
  auto expiry = SteadyClock::addMilliseconds(now(), ms);

  timers[id] = TimerEntry{id, expiry, ms, std::move(callback), is_interval};

  return id;
}

int Poller::calculatePollTimeout(int timeout_ms) const {
  int limit = timeout_ms < 0 ? max_poll_timeout_ms : timeout_ms;

  {
    std::lock_guard<std::mutex> lock(task_mutex);
    if (!posted_tasks.empty()) {
      return 0;
    }
  }

  if (timers.empty()) {
    return limit;
  }

  auto next_expiry = SteadyClock::TimePoint::max();
  for (const auto &pair : timers) {
    next_expiry = std::min(next_expiry, pair.second.expiry_time);
  }

  // Calculate milliseconds until next expiry
  int64_t until_next = SteadyClock::durationMs(now(), next_expiry);
  return static_cast<int>(std::max<int64_t>(0, std::min<int64_t>(until_next, limit)));
}

// Fires due timers earliest first. Timers created by a callback during this
// pass wait for the next poll, so a callback re-arming itself with a zero
// delay cannot starve the loop.
size_t Poller::processExpiredTimers() {
  const TimerID id_limit = next_timer_id;
  const auto now_time = now();
  size_t fired = 0;

  while (true) {
    auto due = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (it->first >= id_limit || it->second.expiry_time > now_time) {
        continue;
      }
      if (due == timers.end() ||
          it->second.expiry_time < due->second.expiry_time) {
        due = it;
      }
    }

    if (due == timers.end()) {
      break;
    }

    // Reschedule or retire before running, so the callback may clear or
    // replace its own timer
    TimerCallback callback = due->second.callback;
    if (due->second.is_interval) {
      due->second.expiry_time = SteadyClock::addMilliseconds(
          due->second.expiry_time, due->second.interval_ms);
    } else {
      timers.erase(due);
    }

    fired++;
    try {
      callback();
    } catch (const std::exception &e) {
      LOG_ERROR("Timer callback threw: ", e.what());
    }
  }

  return fired;
}

size_t Poller::processPostedTasks() {
  std::vector<Task> tasks;
  {
    std::lock_guard<std::mutex> lock(task_mutex);
    tasks.swap(posted_tasks);
  }

  for (auto &task : tasks) {
    try {
      task();
    } catch (const std::exception &e) {
      LOG_ERROR("Posted task threw: ", e.what());
    }
  }

  return tasks.size();
}

// Pipe helper methods
bool Poller::createNotificationPipe() {
  if (notification_pipe[0] == -1 && notification_pipe[1] == -1) {
    if (pipe(notification_pipe) == -1) {
      notification_pipe[0] = -1;
      notification_pipe[1] = -1;
      return false;
    }

    // Both ends non-blocking: a full pipe already guarantees a wake-up
    for (int fd : notification_pipe) {
      int flags = fcntl(fd, F_GETFL, 0);
      if (flags != -1) {
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
      }
    }

    return true;
  }
  return true; // Already created
}

void Poller::closeNotificationPipe() {
  if (notification_pipe[0] != -1) {
    close(notification_pipe[0]);
    notification_pipe[0] = -1;
  }
  if (notification_pipe[1] != -1) {
    close(notification_pipe[1]);
    notification_pipe[1] = -1;
  }
}

bool Poller::hasNotificationPipe() const { return notification_pipe[0] != -1; }

void Poller::drainNotificationPipe() {
  if (hasNotificationPipe()) {
    char buffer[256];
    while (read(notification_pipe[0], buffer, sizeof(buffer)) > 0) {
      // Just drain
    }
  }
}

} // namespace tabletimer
