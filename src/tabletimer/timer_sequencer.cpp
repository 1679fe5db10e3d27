#include "tabletimer/timer_sequencer.hpp"
#include "tabletimer/format.hpp"
#include "tabletimer/log.hpp"
#include <algorithm>

namespace tabletimer {

const char *sequencerStateName(SequencerState state) {
  switch (state) {
  case SequencerState::IDLE:
    return "idle";
  case SequencerState::RUNNING:
    return "running";
  case SequencerState::PAUSED:
    return "paused";
  }
  return "unknown";
}

TimerSequencer::TimerSequencer(Poller &poller, SoundPlayer &sound_player,
                               uint32_t heartbeat_ms)
    : poller(poller), sound_player(sound_player),
      heartbeat_ms(heartbeat_ms == 0 ? DEFAULT_HEARTBEAT_MS : heartbeat_ms) {}

TimerSequencer::~TimerSequencer() { stopHeartbeat(); }

bool TimerSequencer::load(const std::vector<TimerDefinition> &timers) {
  if (current_state != SequencerState::IDLE) {
    LOG_ERROR("Cannot replace timers while the sequence is ",
              sequencerStateName(current_state));
    return false;
  }

  sequence = timers;
  std::stable_sort(sequence.begin(), sequence.end(),
                   [](const TimerDefinition &a, const TimerDefinition &b) {
                     return a.order < b.order;
                   });
  return true;
}

bool TimerSequencer::start(size_t from_index) {
  if (current_state == SequencerState::PAUSED) {
    return resume();
  }

  if (sequence.empty()) {
    return false;
  }

  if (from_index >= sequence.size()) {
    LOG_ERROR("No timer at index ", from_index, " (", sequence.size(),
              " timers)");
    stop();
    return false;
  }

  // Restarting abandons the active timer; listeners clean up on stop
  if (current_state == SequencerState::RUNNING) {
    stop();
  }

  has_current = true;
  current_index = from_index;
  startCurrentTimer();
  return true;
}

bool TimerSequencer::pause() {
  if (completing) {
    // Nothing follows the finished timer, so there is nothing to pause
    if (!autoplay || current_index + 1 >= sequence.size()) {
      return false;
    }
    pause_pending = true;
    return true;
  }

  if (current_state != SequencerState::RUNNING) {
    return false;
  }

  stopHeartbeat();
  current_state = SequencerState::PAUSED;
  LOG("Paused with ", formatClock(time_remaining_ms), " left");

  if (onPaused) {
    onPaused();
  }
  return true;
}

bool TimerSequencer::resume() {
  if (current_state != SequencerState::PAUSED) {
    return false;
  }

  current_state = SequencerState::RUNNING;
  LOG("Resumed with ", formatClock(time_remaining_ms), " left");

  if (onResumed) {
    onResumed();
  }

  if (current_state == SequencerState::RUNNING && heartbeat_timer_id == 0) {
    startHeartbeat();
  }
  return true;
}

void TimerSequencer::stop() {
  bool was_active = current_state != SequencerState::IDLE || has_current;

  stopHeartbeat();
  has_current = false;
  current_index = 0;
  time_remaining_ms = 0;
  current_state = SequencerState::IDLE;
  endCompletion();
  run_generation++;

  if (was_active) {
    LOG("Sequence stopped");
    if (onStopped) {
      onStopped();
    }
  }
}

void TimerSequencer::skipToNext() {
  if (!has_current) {
    return;
  }

  if (current_index + 1 >= sequence.size()) {
    stop();
    return;
  }

  stopHeartbeat();
  TimerDefinition skipped = sequence[current_index];
  current_index++;
  run_generation++;

  // Skipping from the end event decides what runs next; the timer started
  // below takes pause requests directly
  endCompletion();

  if (onTimerSkipped) {
    onTimerSkipped(skipped);
  }

  startCurrentTimer();
}

void TimerSequencer::tick(uint32_t delta_ms) {
  if (current_state != SequencerState::RUNNING || !has_current) {
    return;
  }

  uint64_t generation = run_generation;
  time_remaining_ms -= delta_ms;
  TimerDefinition timer = sequence[current_index];

  LOG_DEBUG(timer.name, " ", formatClock(time_remaining_ms));

  if (onTimerTick) {
    onTimerTick(timer, time_remaining_ms);
  }

  // A listener paused, skipped or stopped
  if (generation != run_generation ||
      current_state != SequencerState::RUNNING) {
    return;
  }

  if (time_remaining_ms <= 0) {
    completeCurrentTimer();
  }
}

const TimerDefinition *TimerSequencer::currentTimer() const {
  return has_current ? &sequence[current_index] : nullptr;
}

void TimerSequencer::startCurrentTimer() {
  stopHeartbeat();
  run_generation++;
  uint64_t generation = run_generation;

  TimerDefinition timer = sequence[current_index];
  time_remaining_ms = timer.duration_ms;
  current_state = SequencerState::RUNNING;

  LOG("Timer '", timer.name, "' started (", current_index + 1, "/",
      sequence.size(), ", ", formatClock(time_remaining_ms), ")");

  if (onTimerStarted) {
    onTimerStarted(timer);
  }

  if (generation != run_generation ||
      current_state != SequencerState::RUNNING) {
    return;
  }

  startHeartbeat();
}

void TimerSequencer::completeCurrentTimer() {
  stopHeartbeat();

  TimerDefinition timer = sequence[current_index];
  uint64_t generation = run_generation;

  LOG("Timer '", timer.name, "' finished");

  completing = true;
  pause_pending = false;
  if (onTimerEnded) {
    onTimerEnded(timer);
  }
  bool pause_next = completing && pause_pending;
  endCompletion();

  sound_player.play(completion_sound);

  // A listener skipped or stopped; that already decided what runs next
  if (generation != run_generation) {
    return;
  }

  if (autoplay && current_index + 1 < sequence.size()) {
    current_index++;
    startCurrentTimer();
    if (pause_next) {
      pause();
    }
  } else {
    stop();
  }
}

void TimerSequencer::endCompletion() {
  completing = false;
  pause_pending = false;
}

void TimerSequencer::startHeartbeat() {
  stopHeartbeat();
  heartbeat_timer_id =
      poller.setInterval(heartbeat_ms, [this]() { tick(heartbeat_ms); });
}

void TimerSequencer::stopHeartbeat() {
  if (heartbeat_timer_id != 0) {
    poller.clearInterval(heartbeat_timer_id);
    heartbeat_timer_id = 0;
  }
}

} // namespace tabletimer
