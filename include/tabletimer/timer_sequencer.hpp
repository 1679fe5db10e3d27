#pragma once

#include "tabletimer/action.hpp"
#include "tabletimer/collaborators.hpp"
#include "tabletimer/model.hpp"
#include "tabletimer/poller.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace tabletimer {

constexpr uint32_t DEFAULT_HEARTBEAT_MS = 100;

enum class SequencerState { IDLE, RUNNING, PAUSED };

const char *sequencerStateName(SequencerState state);

// Runs one countdown at a time over an ordered list of timers.
//
// IDLE --start--> RUNNING <--pause/resume--> PAUSED
// RUNNING --timer done--> RUNNING (next timer, autoplay) or IDLE
// any --stop--> IDLE
//
// Listeners may call back into the sequencer (pause, skip, stop) from
// inside any event.
class TimerSequencer {
public:
  using TimerEvent = std::function<void(const TimerDefinition &timer)>;
  using TickEvent =
      std::function<void(const TimerDefinition &timer, int64_t remaining_ms)>;
  using StateEvent = std::function<void()>;

  TimerSequencer(Poller &poller, SoundPlayer &sound_player,
                 uint32_t heartbeat_ms = DEFAULT_HEARTBEAT_MS);
  ~TimerSequencer();

  TimerSequencer(const TimerSequencer &) = delete;
  TimerSequencer &operator=(const TimerSequencer &) = delete;

  // Replaces the sequence, ordered by TimerDefinition::order. Refused while
  // a run is in progress.
  bool load(const std::vector<TimerDefinition> &timers);
  const std::vector<TimerDefinition> &timers() const { return sequence; }

  // Control
  bool start(size_t from_index = 0);
  bool pause();
  bool resume();
  void stop();
  void skipToNext();

  // Advance the countdown by delta_ms. Driven by the heartbeat; public so
  // the countdown can be stepped by hand.
  void tick(uint32_t delta_ms);

  void setAutoplay(bool enabled) { autoplay = enabled; }
  bool autoplayEnabled() const { return autoplay; }

  void setCompletionSound(Sound sound) { completion_sound = sound; }

  SequencerState state() const { return current_state; }
  bool hasCurrent() const { return has_current; }
  size_t currentIndex() const { return current_index; }
  const TimerDefinition *currentTimer() const;
  int64_t timeRemainingMs() const { return time_remaining_ms; }
  uint32_t heartbeatMs() const { return heartbeat_ms; }

  // Bumped whenever the active timer changes or the run stops
  uint64_t generation() const { return run_generation; }

  // Events
  TimerEvent onTimerStarted;
  TimerEvent onTimerEnded;
  // The active timer was left through skipToNext() before it finished
  TimerEvent onTimerSkipped;
  TickEvent onTimerTick;
  StateEvent onPaused;
  StateEvent onResumed;
  StateEvent onStopped;

protected:
  void startCurrentTimer();
  void completeCurrentTimer();
  void endCompletion();
  void startHeartbeat();
  void stopHeartbeat();

private:
  Poller &poller;
  SoundPlayer &sound_player;
  uint32_t heartbeat_ms;

  std::vector<TimerDefinition> sequence;

  SequencerState current_state = SequencerState::IDLE;
  bool has_current = false;
  size_t current_index = 0;
  int64_t time_remaining_ms = 0;
  uint64_t run_generation = 0;

  bool autoplay = true;
  Sound completion_sound = Sound::BELL;

  // A pause requested while the finished timer's end event is delivered
  // applies to the timer autoplay starts next. Cleared as soon as a skip or
  // stop takes over from the end event.
  bool completing = false;
  bool pause_pending = false;

  Poller::TimerID heartbeat_timer_id = 0;
};

} // namespace tabletimer
