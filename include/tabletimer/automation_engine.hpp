#pragma once

#include "tabletimer/collaborators.hpp"
#include "tabletimer/model.hpp"
#include "tabletimer/scheduler.hpp"
#include "tabletimer/store.hpp"
#include "tabletimer/timer_sequencer.hpp"

#include <map>
#include <set>
#include <string>

namespace tabletimer {

constexpr int DEFAULT_MAX_CASCADE_DEPTH = 8;

// Evaluates the automations of one timer list against sequencer and counter
// events and runs the matching actions.
//
// Timer and counter names in triggers and actions are resolved against the
// list each time they are evaluated; a name that matches nothing is skipped
// without error. Delayed and interval work lives in the Scheduler and is
// dropped whenever the active timer ends, is skipped or the run stops.
class AutomationEngine {
public:
  AutomationEngine(Store &store, Scheduler &scheduler,
                   TimerSequencer &sequencer, SoundPlayer &sound_player,
                   Notifier &notifier);

  AutomationEngine(const AutomationEngine &) = delete;
  AutomationEngine &operator=(const AutomationEngine &) = delete;

  void bindList(const std::string &new_list_id);
  const std::string &listId() const { return list_id; }

  // Limit for counter changes triggering automations that change counters
  void setMaxCascadeDepth(int depth) { max_cascade_depth = depth; }

  // Event handlers
  void onTimerStarted(const TimerDefinition &timer);
  void onTimerEnded(const TimerDefinition &timer);
  void onTimerSkipped(const TimerDefinition &timer);
  void onTimerTick(const TimerDefinition &timer, int64_t remaining_ms);
  void onCounterChanged(const Counter &counter, int old_value, int new_value);
  void onPauseRequested();
  void onResumeRequested();
  void onStopped();

  // Introspection
  size_t activeIntervalCount() const { return intervals.size(); }
  size_t pendingDelayedCount() const { return delayed.size(); }
  bool isArmed(const std::string &automation_id,
               const std::string &trigger_id) const;
  uint64_t executedCount() const { return executed_count; }

private:
  void runAutomation(const Automation &automation);
  void runScheduled(const std::string &automation_id);
  void executeAction(const Automation &automation, const Action &action);
  void modifyCounters(const ModifyCounterAction &action);

  void scheduleDelayed(const Automation &automation,
                       const TimeElapsedTrigger &trigger);
  void startInterval(const Automation &automation,
                     const RepeatingIntervalTrigger &trigger);
  void reconcileIntervals();
  void cancelScheduled();

  const Automation *findAutomation(const std::string &automation_id) const;
  static std::string triggerKey(const Automation &automation,
                                const Trigger &trigger);

  Store &store;
  Scheduler &scheduler;
  TimerSequencer &sequencer;
  SoundPlayer &sound_player;
  Notifier &notifier;

  std::string list_id;

  // Edge detection for TimeRemaining triggers, keyed by automation/trigger
  std::set<std::string> armed;

  // Live RepeatingInterval handles, keyed by automation/trigger
  std::map<std::string, Scheduler::HandleID> intervals;

  // Pending TimeElapsed one-shots
  std::set<Scheduler::HandleID> delayed;

  int cascade_depth = 0;
  int max_cascade_depth = DEFAULT_MAX_CASCADE_DEPTH;
  uint64_t executed_count = 0;
};

} // namespace tabletimer
