#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace tabletimer {

enum class TriggerType {
  TIMER_START,
  TIMER_END,
  TIMER_TIME_REMAINING,
  TIMER_TIME_ELAPSED,
  REPEATING_INTERVAL,
  COUNTER_REACHES_VALUE,
  ANY_TIMER_START,
  ANY_TIMER_END
};

// Base of the closed set of trigger kinds. Each kind is a separate struct
// carrying only its own fields; dispatch on `type` and cast with as<T>().
// Timer and counter references are names, looked up when the trigger is
// evaluated.
struct Trigger {
  TriggerType type;
  std::string id;

  virtual ~Trigger() = default;

  virtual std::unique_ptr<Trigger> clone() const = 0;

  template <typename T> const T *as() const {
    return type == T::TYPE ? static_cast<const T *>(this) : nullptr;
  }

protected:
  explicit Trigger(TriggerType type) : type(type) {}
  Trigger(const Trigger &) = default;
};

template <typename Derived, TriggerType Type> struct TriggerKind : Trigger {
  static constexpr TriggerType TYPE = Type;

  std::unique_ptr<Trigger> clone() const override {
    return std::unique_ptr<Trigger>(
        new Derived(static_cast<const Derived &>(*this)));
  }

protected:
  TriggerKind() : Trigger(Type) {}
};

template <typename Derived, TriggerType Type>
constexpr TriggerType TriggerKind<Derived, Type>::TYPE;

struct TimerStartTrigger
    : TriggerKind<TimerStartTrigger, TriggerType::TIMER_START> {
  std::string timer_name;
};

struct TimerEndTrigger : TriggerKind<TimerEndTrigger, TriggerType::TIMER_END> {
  std::string timer_name;
};

// Fires once when the named timer's remaining time drops to threshold_ms
struct TimeRemainingTrigger
    : TriggerKind<TimeRemainingTrigger, TriggerType::TIMER_TIME_REMAINING> {
  std::string timer_name;
  uint32_t threshold_ms = 0;
};

// Fires offset_ms after the named timer starts
struct TimeElapsedTrigger
    : TriggerKind<TimeElapsedTrigger, TriggerType::TIMER_TIME_ELAPSED> {
  std::string timer_name;
  uint32_t offset_ms = 0;
};

// Fires every period_ms while a timer is running, whichever timer it is
struct RepeatingIntervalTrigger
    : TriggerKind<RepeatingIntervalTrigger, TriggerType::REPEATING_INTERVAL> {
  uint32_t period_ms = 0;
};

struct CounterReachesTrigger
    : TriggerKind<CounterReachesTrigger, TriggerType::COUNTER_REACHES_VALUE> {
  std::string counter_name;
  int target_value = 0;
};

struct AnyTimerStartTrigger
    : TriggerKind<AnyTimerStartTrigger, TriggerType::ANY_TIMER_START> {};

struct AnyTimerEndTrigger
    : TriggerKind<AnyTimerEndTrigger, TriggerType::ANY_TIMER_END> {};

using TriggerPtr = std::shared_ptr<const Trigger>;

// Factory methods
TriggerPtr makeTimerStartTrigger(const std::string &timer_name);
TriggerPtr makeTimerEndTrigger(const std::string &timer_name);
TriggerPtr makeTimeRemainingTrigger(const std::string &timer_name,
                                    uint32_t threshold_ms);
TriggerPtr makeTimeElapsedTrigger(const std::string &timer_name,
                                  uint32_t offset_ms);
TriggerPtr makeRepeatingIntervalTrigger(uint32_t period_ms);
TriggerPtr makeCounterReachesTrigger(const std::string &counter_name,
                                     int target_value);
TriggerPtr makeAnyTimerStartTrigger();
TriggerPtr makeAnyTimerEndTrigger();

// Timer name the trigger refers to, nullptr for kinds without one
const std::string *referencedTimer(const Trigger &trigger);

// Counter name the trigger refers to, nullptr for kinds without one
const std::string *referencedCounter(const Trigger &trigger);

// Stable identifier ("timer_time_remaining") and label ("X Seconds Before
// Timer Ends")
const char *triggerTypeName(TriggerType type);
const char *triggerDisplayName(TriggerType type);
bool parseTriggerType(const std::string &name, TriggerType *type);

std::string describeTrigger(const Trigger &trigger);

} // namespace tabletimer
