#include "tabletimer/model.hpp"
#include <algorithm>

namespace tabletimer {

std::vector<TimerDefinition> TimerList::sortedTimers() const {
  std::vector<TimerDefinition> sorted = timers;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TimerDefinition &a, const TimerDefinition &b) {
                     return a.order < b.order;
                   });
  return sorted;
}

std::vector<Automation> TimerList::sortedAutomations() const {
  std::vector<Automation> sorted = automations;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Automation &a, const Automation &b) {
                     return a.order < b.order;
                   });
  return sorted;
}

const TimerDefinition *
TimerList::findTimerByName(const std::string &timer_name) const {
  for (const auto &timer : timers) {
    if (timer.name == timer_name) {
      return &timer;
    }
  }
  return nullptr;
}

const Counter *TimerList::findCounterByName(const std::string &counter_name) const {
  for (const auto &counter : counters) {
    if (counter.name == counter_name) {
      return &counter;
    }
  }
  return nullptr;
}

} // namespace tabletimer
