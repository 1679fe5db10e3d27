#pragma once

#include "tabletimer/action.hpp"
#include "tabletimer/automation_engine.hpp"
#include "tabletimer/collaborators.hpp"
#include "tabletimer/poller.hpp"
#include "tabletimer/scheduler.hpp"
#include "tabletimer/store.hpp"
#include "tabletimer/timer_sequencer.hpp"

#include <cstdint>
#include <string>

namespace tabletimer {

struct SessionConfig {
  uint32_t heartbeat_ms = DEFAULT_HEARTBEAT_MS;
  bool autoplay = true;
  Sound completion_sound = Sound::BELL;
  int max_cascade_depth = DEFAULT_MAX_CASCADE_DEPTH;
};

// One running list: the sequencer, the scheduler for automation work and
// the engine, wired together on a shared Poller
class Session {
public:
  Session(Poller &poller, Store &store, SoundPlayer &sound_player,
          Notifier &notifier, const SessionConfig &config = SessionConfig());
  ~Session();

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // Loads the list's timers and marks the list as used. Refused while a
  // run is in progress.
  bool open(const std::string &list_id);
  const std::string &listId() const { return list_id; }

  // Playback
  bool start(size_t from_index = 0);
  bool pause();
  bool resume();
  void stop();
  void skipToNext();

  // Counter buttons
  bool incrementCounter(const std::string &counter_id);
  bool decrementCounter(const std::string &counter_id);
  bool resetCounter(const std::string &counter_id);
  bool resetAllCounters();

  TimerSequencer &getSequencer() { return sequencer; }
  const TimerSequencer &getSequencer() const { return sequencer; }
  AutomationEngine &getEngine() { return engine; }
  Scheduler &getScheduler() { return scheduler; }

private:
  bool changeCounter(const std::string &counter_id, void (Counter::*change)());

  Store &store;
  std::string list_id;

  Scheduler scheduler;
  TimerSequencer sequencer;
  AutomationEngine engine;
};

} // namespace tabletimer
