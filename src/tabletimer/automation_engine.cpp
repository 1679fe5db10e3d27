#include "tabletimer/automation_engine.hpp"
#include "tabletimer/log.hpp"
#include <memory>
#include <stdexcept>
#include <vector>

namespace tabletimer {

namespace {

// Keeps the cascade depth balanced when an action throws
struct DepthGuard {
  explicit DepthGuard(int &depth) : depth(depth) { ++depth; }
  ~DepthGuard() { --depth; }
  int &depth;
};

} // namespace

AutomationEngine::AutomationEngine(Store &store, Scheduler &scheduler,
                                   TimerSequencer &sequencer,
                                   SoundPlayer &sound_player,
                                   Notifier &notifier)
    : store(store), scheduler(scheduler), sequencer(sequencer),
      sound_player(sound_player), notifier(notifier) {}

void AutomationEngine::bindList(const std::string &new_list_id) {
  if (new_list_id == list_id) {
    return;
  }
  cancelScheduled();
  list_id = new_list_id;
}

void AutomationEngine::onTimerStarted(const TimerDefinition &timer) {
  const uint64_t generation = sequencer.generation();

  for (const auto &automation : store.automationsFor(list_id)) {
    if (!automation.enabled) {
      continue;
    }

    for (const auto &trigger : automation.triggers) {
      switch (trigger->type) {
      case TriggerType::TIMER_START:
        if (trigger->as<TimerStartTrigger>()->timer_name == timer.name) {
          runAutomation(automation);
        }
        break;
      case TriggerType::ANY_TIMER_START:
        runAutomation(automation);
        break;
      case TriggerType::TIMER_TIME_ELAPSED: {
        auto elapsed = trigger->as<TimeElapsedTrigger>();
        if (elapsed->timer_name == timer.name) {
          scheduleDelayed(automation, *elapsed);
        }
        break;
      }
      case TriggerType::REPEATING_INTERVAL:
        startInterval(automation, *trigger->as<RepeatingIntervalTrigger>());
        break;
      default:
        break;
      }

      // An action moved the sequence on; this timer is no longer current
      if (sequencer.generation() != generation) {
        return;
      }
    }
  }
}

void AutomationEngine::onTimerEnded(const TimerDefinition &timer) {
  // Interval and delayed work belongs to the timer that just finished
  cancelScheduled();
  armed.clear();

  const uint64_t generation = sequencer.generation();

  for (const auto &automation : store.automationsFor(list_id)) {
    if (!automation.enabled) {
      continue;
    }

    for (const auto &trigger : automation.triggers) {
      switch (trigger->type) {
      case TriggerType::TIMER_END:
        if (trigger->as<TimerEndTrigger>()->timer_name == timer.name) {
          runAutomation(automation);
        }
        break;
      case TriggerType::ANY_TIMER_END:
        runAutomation(automation);
        break;
      default:
        break;
      }

      if (sequencer.generation() != generation) {
        return;
      }
    }
  }
}

void AutomationEngine::onTimerSkipped(const TimerDefinition &timer) {
  LOG_DEBUG("Dropping automations of skipped timer '", timer.name, "'");
  cancelScheduled();
  armed.clear();
}

// A TimeRemaining trigger fires on the first tick at or below its threshold
// and stays armed until the remaining time is above the threshold again
void AutomationEngine::onTimerTick(const TimerDefinition &timer,
                                   int64_t remaining_ms) {
  const uint64_t generation = sequencer.generation();

  for (const auto &automation : store.automationsFor(list_id)) {
    if (!automation.enabled) {
      continue;
    }

    for (const auto &trigger : automation.triggers) {
      auto remaining = trigger->as<TimeRemainingTrigger>();
      if (!remaining || remaining->timer_name != timer.name) {
        continue;
      }

      std::string key = triggerKey(automation, *trigger);
      if (remaining_ms <= static_cast<int64_t>(remaining->threshold_ms)) {
        if (armed.insert(key).second) {
          runAutomation(automation);
        }
      } else {
        armed.erase(key);
      }

      if (sequencer.generation() != generation) {
        return;
      }
    }
  }
}

// Fires only on the change into the target value
void AutomationEngine::onCounterChanged(const Counter &counter, int old_value,
                                        int new_value) {
  if (new_value == old_value) {
    return;
  }

  if (cascade_depth >= max_cascade_depth) {
    LOG_ERROR("Counter automations nested ", cascade_depth,
              " deep, not evaluating '", counter.name, "' = ", new_value);
    return;
  }
  DepthGuard guard(cascade_depth);

  for (const auto &automation : store.automationsFor(list_id)) {
    if (!automation.enabled) {
      continue;
    }

    for (const auto &trigger : automation.triggers) {
      auto reaches = trigger->as<CounterReachesTrigger>();
      if (!reaches || reaches->counter_name != counter.name) {
        continue;
      }

      if (new_value == reaches->target_value &&
          old_value != reaches->target_value) {
        runAutomation(automation);
      }
    }
  }
}

void AutomationEngine::onPauseRequested() { scheduler.pauseAll(); }

void AutomationEngine::onResumeRequested() {
  scheduler.resumeAll();
  reconcileIntervals();
}

void AutomationEngine::onStopped() {
  cancelScheduled();
  armed.clear();
}

bool AutomationEngine::isArmed(const std::string &automation_id,
                               const std::string &trigger_id) const {
  return armed.count(automation_id + "/" + trigger_id) > 0;
}

// One automation's failure never stops the others
void AutomationEngine::runAutomation(const Automation &automation) {
  for (const auto &action : automation.actions) {
    try {
      executeAction(automation, *action);
    } catch (const std::exception &e) {
      LOG_ERROR("Automation '", automation.name, "' failed at ",
                describeAction(*action), ": ", e.what());
      return;
    }
  }
}

// Scheduled work re-reads the automation, which may have been edited,
// disabled or removed since it was armed
void AutomationEngine::runScheduled(const std::string &automation_id) {
  const Automation *found = findAutomation(automation_id);
  if (!found || !found->enabled) {
    return;
  }

  Automation automation = *found;
  runAutomation(automation);
}

void AutomationEngine::executeAction(const Automation &automation,
                                     const Action &action) {
  executed_count++;
  LOG("Automation '", automation.name, "': ", describeAction(action));

  switch (action.type) {
  case ActionType::PLAY_SOUND:
    sound_player.play(action.as<PlaySoundAction>()->sound);
    break;
  case ActionType::MODIFY_COUNTER:
    modifyCounters(*action.as<ModifyCounterAction>());
    break;
  case ActionType::SHOW_NOTIFICATION:
    notifier.show(action.as<ShowNotificationAction>()->message);
    break;
  case ActionType::PAUSE_TIMER:
    sequencer.pause();
    break;
  case ActionType::SKIP_TIMER:
    sequencer.skipToNext();
    break;
  }
}

// Every counter of the list with the action's name is changed, then the
// list is saved once and a change event is raised per counter that moved
void AutomationEngine::modifyCounters(const ModifyCounterAction &action) {
  struct Change {
    Counter counter;
    int old_value;
  };
  std::vector<Change> changes;

  for (Counter *counter : store.findCountersByName(list_id, action.counter_name)) {
    int old_value = counter->value;
    counter->adjust(action.delta);
    if (counter->value != old_value) {
      changes.push_back({*counter, old_value});
    }
  }

  if (!store.save()) {
    LOG_ERROR("Failed to save counter '", action.counter_name,
              "', keeping in-memory value");
  }

  for (const auto &change : changes) {
    onCounterChanged(change.counter, change.old_value, change.counter.value);
  }
}

void AutomationEngine::scheduleDelayed(const Automation &automation,
                                       const TimeElapsedTrigger &trigger) {
  auto handle = std::make_shared<Scheduler::HandleID>(0);
  std::string automation_id = automation.id;

  *handle = scheduler.scheduleOnce(
      trigger.offset_ms, [this, handle, automation_id]() {
        delayed.erase(*handle);
        runScheduled(automation_id);
      });
  delayed.insert(*handle);
}

void AutomationEngine::startInterval(const Automation &automation,
                                     const RepeatingIntervalTrigger &trigger) {
  std::string key = triggerKey(automation, trigger);

  auto existing = intervals.find(key);
  if (existing != intervals.end()) {
    scheduler.cancel(existing->second);
  }

  std::string automation_id = automation.id;
  intervals[key] = scheduler.scheduleRepeating(
      trigger.period_ms, [this, automation_id]() { runScheduled(automation_id); });
}

// After a resume: every enabled interval automation of the list should have
// a live handle while a timer is current, and nothing else should
void AutomationEngine::reconcileIntervals() {
  if (!sequencer.hasCurrent()) {
    return;
  }

  std::set<std::string> wanted;
  for (const auto &automation : store.automationsFor(list_id)) {
    if (!automation.enabled) {
      continue;
    }

    for (const auto &trigger : automation.triggers) {
      auto interval = trigger->as<RepeatingIntervalTrigger>();
      if (!interval) {
        continue;
      }

      std::string key = triggerKey(automation, *trigger);
      wanted.insert(key);

      auto it = intervals.find(key);
      if (it == intervals.end() || !scheduler.isActive(it->second)) {
        LOG("Arming interval of automation '", automation.name, "'");
        startInterval(automation, *interval);
      }
    }
  }

  for (auto it = intervals.begin(); it != intervals.end();) {
    if (wanted.count(it->first) == 0) {
      scheduler.cancel(it->second);
      it = intervals.erase(it);
    } else {
      ++it;
    }
  }
}

void AutomationEngine::cancelScheduled() {
  scheduler.stopAll();
  intervals.clear();
  delayed.clear();
}

const Automation *
AutomationEngine::findAutomation(const std::string &automation_id) const {
  const TimerList *list = store.findList(list_id);
  if (!list) {
    return nullptr;
  }
  for (const auto &automation : list->automations) {
    if (automation.id == automation_id) {
      return &automation;
    }
  }
  return nullptr;
}

std::string AutomationEngine::triggerKey(const Automation &automation,
                                         const Trigger &trigger) {
  return automation.id + "/" + trigger.id;
}

} // namespace tabletimer
