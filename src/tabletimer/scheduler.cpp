#include "tabletimer/scheduler.hpp"
#include "tabletimer/log.hpp"

namespace tabletimer {

Scheduler::Scheduler(Poller &poller) : poller(poller) {}

Scheduler::~Scheduler() { stopAll(); }

Scheduler::HandleID Scheduler::scheduleOnce(uint32_t delay_ms,
                                            Callback callback) {
  return add(delay_ms, false, std::move(callback));
}

Scheduler::HandleID Scheduler::scheduleRepeating(uint32_t period_ms,
                                                 Callback callback) {
  return add(period_ms == 0 ? 1 : period_ms, true, std::move(callback));
}

bool Scheduler::cancel(HandleID handle) {
  auto it = entries.find(handle);
  if (it == entries.end()) {
    return false;
  }
  disarm(it->second);
  entries.erase(it);
  return true;
}

// Pause all handles
// Stops the poller timers and folds the time spent since the last mark into
// each handle's elapsed total
void Scheduler::pauseAll() {
  if (paused) {
    return;
  }
  paused = true;

  auto now = poller.now();
  for (auto &pair : entries) {
    Entry &entry = pair.second;
    int64_t since_mark = SteadyClock::durationMs(entry.mark, now);
    entry.elapsed_ms += since_mark > 0 ? static_cast<uint64_t>(since_mark) : 0;
    disarm(entry);
  }

  LOG_DEBUG("Scheduler paused with ", entries.size(), " handles");
}

// Resume all handles from the phase recorded by pauseAll()
void Scheduler::resumeAll() {
  if (!paused) {
    return;
  }
  paused = false;

  for (auto &pair : entries) {
    arm(pair.second);
  }

  LOG_DEBUG("Scheduler resumed with ", entries.size(), " handles");
}

void Scheduler::stopAll() {
  for (auto &pair : entries) {
    disarm(pair.second);
  }
  entries.clear();
  paused = false;
}

bool Scheduler::isActive(HandleID handle) const {
  return entries.find(handle) != entries.end();
}

uint32_t Scheduler::remainingMs(HandleID handle) const {
  auto it = entries.find(handle);
  if (it == entries.end()) {
    return 0;
  }

  const Entry &entry = it->second;
  uint64_t elapsed = elapsedMs(entry);
  if (entry.repeating) {
    return static_cast<uint32_t>(entry.period_ms - elapsed % entry.period_ms);
  }
  return elapsed >= entry.period_ms
             ? 0
             : static_cast<uint32_t>(entry.period_ms - elapsed);
}

Scheduler::HandleID Scheduler::add(uint32_t period_ms, bool repeating,
                                   Callback callback) {
  HandleID id = next_handle_id++;

  Entry entry;
  entry.id = id;
  entry.period_ms = period_ms;
  entry.repeating = repeating;
  entry.callback = std::move(callback);
  entry.mark = poller.now();

  auto result = entries.emplace(id, std::move(entry));
  if (!paused) {
    arm(result.first->second);
  }
  return id;
}

void Scheduler::arm(Entry &entry) {
  disarm(entry);
  entry.mark = poller.now();

  HandleID id = entry.id;
  if (entry.repeating && entry.elapsed_ms == 0) {
    entry.realigning = false;
    entry.timer_id = poller.setInterval(entry.period_ms, [this, id] { fire(id); });
    return;
  }

  uint32_t wait_ms;
  if (entry.repeating) {
    wait_ms = static_cast<uint32_t>(entry.period_ms -
                                    entry.elapsed_ms % entry.period_ms);
    entry.realigning = true;
  } else {
    wait_ms = entry.elapsed_ms >= entry.period_ms
                  ? 0
                  : static_cast<uint32_t>(entry.period_ms - entry.elapsed_ms);
  }
  entry.timer_id = poller.setTimeout(wait_ms, [this, id] { fire(id); });
}

void Scheduler::disarm(Entry &entry) {
  if (entry.timer_id != 0) {
    poller.clearTimeout(entry.timer_id);
    entry.timer_id = 0;
  }
}

// Bookkeeping is settled before the callback runs, so the callback may
// cancel, pause or stop anything, this handle included
void Scheduler::fire(HandleID handle) {
  auto it = entries.find(handle);
  if (it == entries.end()) {
    return;
  }

  Entry &entry = it->second;
  Callback callback = entry.callback;

  if (!entry.repeating) {
    entries.erase(it);
  } else {
    entry.elapsed_ms = 0;
    entry.mark = poller.now();
    if (entry.realigning) {
      // The one-shot that finished the paused period is spent; continue on
      // the regular period from here
      entry.timer_id = 0;
      arm(entry);
    }
  }

  callback();
}

uint64_t Scheduler::elapsedMs(const Entry &entry) const {
  if (paused) {
    return entry.elapsed_ms;
  }
  int64_t since_mark = SteadyClock::durationMs(entry.mark, poller.now());
  return entry.elapsed_ms +
         (since_mark > 0 ? static_cast<uint64_t>(since_mark) : 0);
}

} // namespace tabletimer
