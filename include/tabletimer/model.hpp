#pragma once
#include "tabletimer/action.hpp"
#include "tabletimer/counter.hpp"
#include "tabletimer/trigger.hpp"
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace tabletimer {

using WallClock = std::chrono::system_clock;

struct TimerDefinition {
  std::string id;
  std::string name;
  uint32_t duration_ms = 0;
  int order = 0;
};

struct Automation {
  std::string id;
  std::string name;
  bool enabled = true;
  int order = 0;
  WallClock::time_point created_at;

  // Replaced as a whole on every edit
  std::vector<TriggerPtr> triggers;
  std::vector<ActionPtr> actions;
};

// Everything needed to create or rewrite an automation in one step
struct AutomationDraft {
  std::string name;
  bool enabled = true;
  std::vector<TriggerPtr> triggers;
  std::vector<ActionPtr> actions;
};

// Owns its timers, counters and automations
struct TimerList {
  std::string id;
  std::string name;
  std::string color_hex = "#007AFF";
  WallClock::time_point created_at;
  bool has_been_used = false;
  WallClock::time_point last_used_at;

  std::vector<TimerDefinition> timers;
  std::vector<Counter> counters;
  std::vector<Automation> automations;

  // Copies sorted by order
  std::vector<TimerDefinition> sortedTimers() const;
  std::vector<Automation> sortedAutomations() const;

  const TimerDefinition *findTimerByName(const std::string &name) const;
  const Counter *findCounterByName(const std::string &name) const;
};

} // namespace tabletimer
