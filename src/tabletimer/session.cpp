#include "tabletimer/session.hpp"
#include "tabletimer/log.hpp"
#include <utility>
#include <vector>

namespace tabletimer {

Session::Session(Poller &poller, Store &store, SoundPlayer &sound_player,
                 Notifier &notifier, const SessionConfig &config)
    : store(store), scheduler(poller),
      sequencer(poller, sound_player, config.heartbeat_ms),
      engine(store, scheduler, sequencer, sound_player, notifier) {
  sequencer.setAutoplay(config.autoplay);
  sequencer.setCompletionSound(config.completion_sound);
  engine.setMaxCascadeDepth(config.max_cascade_depth);

  sequencer.onTimerStarted = [this](const TimerDefinition &timer) {
    engine.onTimerStarted(timer);
  };
  sequencer.onTimerEnded = [this](const TimerDefinition &timer) {
    engine.onTimerEnded(timer);
  };
  sequencer.onTimerSkipped = [this](const TimerDefinition &timer) {
    engine.onTimerSkipped(timer);
  };
  sequencer.onTimerTick = [this](const TimerDefinition &timer,
                                  int64_t remaining_ms) {
    engine.onTimerTick(timer, remaining_ms);
  };
  sequencer.onPaused = [this]() { engine.onPauseRequested(); };
  sequencer.onResumed = [this]() { engine.onResumeRequested(); };
  sequencer.onStopped = [this]() { engine.onStopped(); };
}

Session::~Session() {
  sequencer.stop();

  sequencer.onTimerStarted = nullptr;
  sequencer.onTimerEnded = nullptr;
  sequencer.onTimerSkipped = nullptr;
  sequencer.onTimerTick = nullptr;
  sequencer.onPaused = nullptr;
  sequencer.onResumed = nullptr;
  sequencer.onStopped = nullptr;
}

bool Session::open(const std::string &new_list_id) {
  if (sequencer.state() != SequencerState::IDLE) {
    LOG_ERROR("Cannot open another list while the sequence is ",
              sequencerStateName(sequencer.state()));
    return false;
  }

  const TimerList *list = store.findList(new_list_id);
  if (!list) {
    LOG_ERROR("No list with id ", new_list_id);
    return false;
  }

  if (!sequencer.load(list->sortedTimers())) {
    return false;
  }

  list_id = new_list_id;
  engine.bindList(list_id);
  store.touchList(list_id);

  LOG("Opened list '", list->name, "' with ", list->timers.size(),
      " timers and ", list->automations.size(), " automations");
  return true;
}

// Timers edited since open() are picked up on every fresh start
bool Session::start(size_t from_index) {
  if (sequencer.state() == SequencerState::IDLE) {
    const TimerList *list = store.findList(list_id);
    if (!list) {
      LOG_ERROR("No list open");
      return false;
    }
    if (!sequencer.load(list->sortedTimers())) {
      return false;
    }
  }
  return sequencer.start(from_index);
}

bool Session::pause() { return sequencer.pause(); }

bool Session::resume() { return sequencer.resume(); }

void Session::stop() { sequencer.stop(); }

void Session::skipToNext() { sequencer.skipToNext(); }

bool Session::incrementCounter(const std::string &counter_id) {
  return changeCounter(counter_id, &Counter::increment);
}

bool Session::decrementCounter(const std::string &counter_id) {
  return changeCounter(counter_id, &Counter::decrement);
}

bool Session::resetCounter(const std::string &counter_id) {
  return changeCounter(counter_id, &Counter::reset);
}

bool Session::resetAllCounters() {
  TimerList *list = store.findList(list_id);
  if (!list) {
    return false;
  }

  std::vector<std::pair<Counter, int>> changed;
  for (auto &counter : list->counters) {
    int old_value = counter.value;
    counter.reset();
    if (counter.value != old_value) {
      changed.emplace_back(counter, old_value);
    }
  }

  if (!store.save()) {
    LOG_ERROR("Failed to save counters of list '", list->name,
              "', keeping in-memory values");
  }

  for (const auto &change : changed) {
    engine.onCounterChanged(change.first, change.second, change.first.value);
  }
  return true;
}

// Only counters of the open list respond to the buttons
bool Session::changeCounter(const std::string &counter_id,
                            void (Counter::*change)()) {
  TimerList *list = store.findList(list_id);
  if (!list) {
    return false;
  }

  Counter *counter = nullptr;
  for (auto &candidate : list->counters) {
    if (candidate.id == counter_id) {
      counter = &candidate;
      break;
    }
  }
  if (!counter) {
    return false;
  }

  int old_value = counter->value;
  (counter->*change)();
  if (counter->value == old_value) {
    return true;
  }

  Counter snapshot = *counter;
  if (!store.save()) {
    LOG_ERROR("Failed to save counter '", snapshot.name,
              "', keeping in-memory value");
  }

  engine.onCounterChanged(snapshot, old_value, snapshot.value);
  return true;
}

} // namespace tabletimer
