#pragma once

#include "tabletimer/poller.hpp"
#include "tabletimer/steady_clock.hpp"

#include <cstdint>
#include <functional>
#include <map>

namespace tabletimer {

// Delayed and periodic callbacks on top of the Poller that can be paused
// as a group without losing their phase.
//
// While paused, every handle keeps the time that had elapsed since its last
// firing (or since it was scheduled). Resuming re-arms a repeating handle
// with period - (elapsed % period) and a one-shot with delay - elapsed.
// Elapsed time keeps accumulating over several pause/resume cycles and only
// goes back to zero when the handle fires.
class Scheduler {
public:
  using HandleID = uint32_t;
  using Callback = std::function<void()>;

  explicit Scheduler(Poller &poller);
  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  HandleID scheduleOnce(uint32_t delay_ms, Callback callback);
  HandleID scheduleRepeating(uint32_t period_ms, Callback callback);
  bool cancel(HandleID handle);

  void pauseAll();
  void resumeAll();

  // Cancels everything and forgets all elapsed-time bookkeeping
  void stopAll();

  bool isPaused() const { return paused; }
  bool isActive(HandleID handle) const;
  size_t size() const { return entries.size(); }

  // Time until the handle next fires, as it would be armed now
  uint32_t remainingMs(HandleID handle) const;

private:
  struct Entry {
    HandleID id;
    uint32_t period_ms;
    bool repeating;
    Callback callback;

    // 0 while paused
    Poller::TimerID timer_id = 0;

    // Last firing, scheduling or resume
    SteadyClock::TimePoint mark;

    // Accumulated before the last pause
    uint64_t elapsed_ms = 0;

    // Armed as a one-shot for the rest of a paused period; goes back to a
    // plain interval once that fires
    bool realigning = false;
  };

  HandleID add(uint32_t period_ms, bool repeating, Callback callback);
  void arm(Entry &entry);
  void disarm(Entry &entry);
  void fire(HandleID handle);
  uint64_t elapsedMs(const Entry &entry) const;

  Poller &poller;
  std::map<HandleID, Entry> entries;
  HandleID next_handle_id = 1;
  bool paused = false;
};

} // namespace tabletimer
