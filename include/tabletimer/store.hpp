#pragma once
#include "tabletimer/model.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace tabletimer {

// Checks a draft against the list it would belong to: a name, at least one
// trigger and one action, referenced timers and counters present in the
// list, positive intervals, non-empty messages.
bool validateAutomation(const TimerList &list, const AutomationDraft &draft,
                        std::string *error = nullptr);

// In-memory owner of every list and its children. Each mutation is applied
// first and then handed to saveFunction; a failed save is logged and the
// in-memory state is kept.
class Store {
public:
  using SaveFunction = std::function<bool(const Store &)>;

  // Persistence hook, defaults to keeping everything in memory
  SaveFunction saveFunction = [](const Store &) { return true; };

  // Lists
  std::string createList(const std::string &name,
                         std::string *error = nullptr);
  bool renameList(const std::string &list_id, const std::string &name);
  bool touchList(const std::string &list_id);
  bool deleteList(const std::string &list_id);
  TimerList *findList(const std::string &list_id);
  const TimerList *findList(const std::string &list_id) const;
  std::vector<const TimerList *> lists() const;

  // Timers
  std::string addTimer(const std::string &list_id, const std::string &name,
                       uint32_t duration_ms, std::string *error = nullptr);
  bool updateTimer(const std::string &timer_id, const std::string &name,
                   uint32_t duration_ms, std::string *error = nullptr);
  bool removeTimer(const std::string &timer_id);
  bool moveTimer(const std::string &timer_id, size_t to_index);
  const TimerDefinition *findTimer(const std::string &timer_id) const;

  // Counters. id, value and order of `counter` are assigned here.
  std::string addCounter(const std::string &list_id, const Counter &counter,
                         std::string *error = nullptr);
  bool updateCounter(const std::string &counter_id, const Counter &counter,
                     std::string *error = nullptr);
  bool removeCounter(const std::string &counter_id);
  bool moveCounter(const std::string &counter_id, size_t to_index);
  bool resetCounters(const std::string &list_id);
  Counter *findCounter(const std::string &counter_id);
  const Counter *findCounter(const std::string &counter_id) const;
  std::vector<Counter *> findCountersByName(const std::string &list_id,
                                            const std::string &name);

  // Automations. Create and update take the whole draft; triggers and
  // actions get fresh ids each time.
  std::string createAutomation(const std::string &list_id,
                               const AutomationDraft &draft,
                               std::string *error = nullptr);
  bool updateAutomation(const std::string &automation_id,
                        const AutomationDraft &draft,
                        std::string *error = nullptr);
  bool setAutomationEnabled(const std::string &automation_id, bool enabled);
  bool removeAutomation(const std::string &automation_id);
  bool moveAutomation(const std::string &automation_id, size_t to_index);
  const Automation *findAutomation(const std::string &automation_id) const;
  const Trigger *findTrigger(const std::string &trigger_id) const;
  const Action *findAction(const std::string &action_id) const;

  // Snapshot of a list's automations ordered by `order`; empty for an
  // unknown list
  std::vector<Automation> automationsFor(const std::string &list_id) const;

  bool save();
  size_t saveCount() const { return save_count; }

private:
  template <typename T> struct Location {
    TimerList *list = nullptr;
    T *item = nullptr;
  };

  Location<TimerDefinition> locateTimer(const std::string &timer_id);
  Location<Counter> locateCounter(const std::string &counter_id);
  Location<Automation> locateAutomation(const std::string &automation_id);

  void commitDraft(Automation &automation, const AutomationDraft &draft);
  void persist();

  std::map<std::string, TimerList> lists_;
  size_t save_count = 0;
};

} // namespace tabletimer
