#include "tabletimer/trigger.hpp"
#include "tabletimer/format.hpp"
#include <sstream>

namespace tabletimer {

namespace {

template <typename T> std::shared_ptr<T> makeTrigger() {
  return std::make_shared<T>();
}

struct TriggerTypeEntry {
  TriggerType type;
  const char *name;
  const char *display_name;
};

const TriggerTypeEntry TRIGGER_TYPES[] = {
    {TriggerType::TIMER_START, "timer_start", "Timer Starts"},
    {TriggerType::TIMER_END, "timer_end", "Timer Ends"},
    {TriggerType::TIMER_TIME_REMAINING, "timer_time_remaining",
     "X Seconds Before Timer Ends"},
    {TriggerType::TIMER_TIME_ELAPSED, "timer_time_elapsed",
     "X Seconds After Timer Starts"},
    {TriggerType::REPEATING_INTERVAL, "repeating_interval", "Every X Seconds"},
    {TriggerType::COUNTER_REACHES_VALUE, "counter_reaches_value",
     "Counter Reaches Value"},
    {TriggerType::ANY_TIMER_START, "any_timer_start", "Any Timer Starts"},
    {TriggerType::ANY_TIMER_END, "any_timer_end", "Any Timer Ends"},
};

} // namespace

TriggerPtr makeTimerStartTrigger(const std::string &timer_name) {
  auto trigger = makeTrigger<TimerStartTrigger>();
  trigger->timer_name = timer_name;
  return trigger;
}

TriggerPtr makeTimerEndTrigger(const std::string &timer_name) {
  auto trigger = makeTrigger<TimerEndTrigger>();
  trigger->timer_name = timer_name;
  return trigger;
}

TriggerPtr makeTimeRemainingTrigger(const std::string &timer_name,
                                    uint32_t threshold_ms) {
  auto trigger = makeTrigger<TimeRemainingTrigger>();
  trigger->timer_name = timer_name;
  trigger->threshold_ms = threshold_ms;
  return trigger;
}

TriggerPtr makeTimeElapsedTrigger(const std::string &timer_name,
                                  uint32_t offset_ms) {
  auto trigger = makeTrigger<TimeElapsedTrigger>();
  trigger->timer_name = timer_name;
  trigger->offset_ms = offset_ms;
  return trigger;
}

TriggerPtr makeRepeatingIntervalTrigger(uint32_t period_ms) {
  auto trigger = makeTrigger<RepeatingIntervalTrigger>();
  trigger->period_ms = period_ms;
  return trigger;
}

TriggerPtr makeCounterReachesTrigger(const std::string &counter_name,
                                     int target_value) {
  auto trigger = makeTrigger<CounterReachesTrigger>();
  trigger->counter_name = counter_name;
  trigger->target_value = target_value;
  return trigger;
}

TriggerPtr makeAnyTimerStartTrigger() {
  return makeTrigger<AnyTimerStartTrigger>();
}

TriggerPtr makeAnyTimerEndTrigger() { return makeTrigger<AnyTimerEndTrigger>(); }

const std::string *referencedTimer(const Trigger &trigger) {
  switch (trigger.type) {
  case TriggerType::TIMER_START:
    return &trigger.as<TimerStartTrigger>()->timer_name;
  case TriggerType::TIMER_END:
    return &trigger.as<TimerEndTrigger>()->timer_name;
  case TriggerType::TIMER_TIME_REMAINING:
    return &trigger.as<TimeRemainingTrigger>()->timer_name;
  case TriggerType::TIMER_TIME_ELAPSED:
    return &trigger.as<TimeElapsedTrigger>()->timer_name;
  case TriggerType::REPEATING_INTERVAL:
  case TriggerType::COUNTER_REACHES_VALUE:
  case TriggerType::ANY_TIMER_START:
  case TriggerType::ANY_TIMER_END:
    return nullptr;
  }
  return nullptr;
}

const std::string *referencedCounter(const Trigger &trigger) {
  if (auto counter = trigger.as<CounterReachesTrigger>()) {
    return &counter->counter_name;
  }
  return nullptr;
}

const char *triggerTypeName(TriggerType type) {
  for (const auto &entry : TRIGGER_TYPES) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

const char *triggerDisplayName(TriggerType type) {
  for (const auto &entry : TRIGGER_TYPES) {
    if (entry.type == type) {
      return entry.display_name;
    }
  }
  return "Unknown";
}

bool parseTriggerType(const std::string &name, TriggerType *type) {
  for (const auto &entry : TRIGGER_TYPES) {
    if (name == entry.name) {
      *type = entry.type;
      return true;
    }
  }
  return false;
}

std::string describeTrigger(const Trigger &trigger) {
  std::ostringstream oss;

  switch (trigger.type) {
  case TriggerType::TIMER_START:
    oss << "Timer '" << trigger.as<TimerStartTrigger>()->timer_name
        << "' starts";
    break;
  case TriggerType::TIMER_END:
    oss << "Timer '" << trigger.as<TimerEndTrigger>()->timer_name << "' ends";
    break;
  case TriggerType::TIMER_TIME_REMAINING: {
    auto remaining = trigger.as<TimeRemainingTrigger>();
    oss << formatSeconds(remaining->threshold_ms) << " before '"
        << remaining->timer_name << "' ends";
    break;
  }
  case TriggerType::TIMER_TIME_ELAPSED: {
    auto elapsed = trigger.as<TimeElapsedTrigger>();
    oss << formatSeconds(elapsed->offset_ms) << " after '"
        << elapsed->timer_name << "' starts";
    break;
  }
  case TriggerType::REPEATING_INTERVAL:
    oss << "Every "
        << formatSeconds(trigger.as<RepeatingIntervalTrigger>()->period_ms);
    break;
  case TriggerType::COUNTER_REACHES_VALUE: {
    auto counter = trigger.as<CounterReachesTrigger>();
    oss << "Counter '" << counter->counter_name << "' reaches "
        << counter->target_value;
    break;
  }
  case TriggerType::ANY_TIMER_START:
    oss << "Any timer starts";
    break;
  case TriggerType::ANY_TIMER_END:
    oss << "Any timer ends";
    break;
  }

  return oss.str();
}

} // namespace tabletimer
