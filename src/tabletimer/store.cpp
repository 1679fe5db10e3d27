#include "tabletimer/store.hpp"
#include "tabletimer/id.hpp"
#include "tabletimer/log.hpp"
#include <algorithm>

namespace tabletimer {

namespace {

void setError(std::string *error, const std::string &message) {
  if (error) {
    *error = message;
  }
}

// Rewrites `order` as 0..n-1 following the current order values
template <typename T> void compactOrder(std::vector<T> &items) {
  std::vector<T *> sorted;
  for (auto &item : items) {
    sorted.push_back(&item);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const T *a, const T *b) { return a->order < b->order; });
  for (size_t i = 0; i < sorted.size(); ++i) {
    sorted[i]->order = static_cast<int>(i);
  }
}

template <typename T>
bool moveInOrder(std::vector<T> &items, const std::string &id,
                 size_t to_index) {
  std::vector<T *> sorted;
  for (auto &item : items) {
    sorted.push_back(&item);
  }
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const T *a, const T *b) { return a->order < b->order; });

  auto it = std::find_if(sorted.begin(), sorted.end(),
                         [&id](const T *item) { return item->id == id; });
  if (it == sorted.end()) {
    return false;
  }

  T *moving = *it;
  sorted.erase(it);
  sorted.insert(sorted.begin() + std::min(to_index, sorted.size()), moving);

  for (size_t i = 0; i < sorted.size(); ++i) {
    sorted[i]->order = static_cast<int>(i);
  }
  return true;
}

bool validateTrigger(const TimerList &list, const Trigger &trigger,
                     std::string *error) {
  switch (trigger.type) {
  case TriggerType::TIMER_START:
  case TriggerType::TIMER_END:
  case TriggerType::TIMER_TIME_REMAINING:
  case TriggerType::TIMER_TIME_ELAPSED: {
    const std::string &timer_name = *referencedTimer(trigger);
    if (timer_name.empty()) {
      setError(error, std::string(triggerDisplayName(trigger.type)) +
                          " needs a timer");
      return false;
    }
    if (!list.findTimerByName(timer_name)) {
      setError(error, "No timer named '" + timer_name + "' in this list");
      return false;
    }
    return true;
  }
  case TriggerType::REPEATING_INTERVAL:
    if (trigger.as<RepeatingIntervalTrigger>()->period_ms == 0) {
      setError(error, "Interval must be longer than zero");
      return false;
    }
    return true;
  case TriggerType::COUNTER_REACHES_VALUE: {
    const std::string &counter_name = *referencedCounter(trigger);
    if (counter_name.empty()) {
      setError(error, "Counter trigger needs a counter");
      return false;
    }
    if (!list.findCounterByName(counter_name)) {
      setError(error, "No counter named '" + counter_name + "' in this list");
      return false;
    }
    return true;
  }
  case TriggerType::ANY_TIMER_START:
  case TriggerType::ANY_TIMER_END:
    return true;
  }
  return false;
}

bool validateAction(const TimerList &list, const Action &action,
                    std::string *error) {
  switch (action.type) {
  case ActionType::MODIFY_COUNTER: {
    const std::string &counter_name = *referencedCounter(action);
    if (counter_name.empty()) {
      setError(error, "Modify Counter needs a counter");
      return false;
    }
    if (!list.findCounterByName(counter_name)) {
      setError(error, "No counter named '" + counter_name + "' in this list");
      return false;
    }
    return true;
  }
  case ActionType::SHOW_NOTIFICATION:
    if (action.as<ShowNotificationAction>()->message.empty()) {
      setError(error, "Notification needs a message");
      return false;
    }
    return true;
  case ActionType::PLAY_SOUND:
  case ActionType::PAUSE_TIMER:
  case ActionType::SKIP_TIMER:
    return true;
  }
  return false;
}

} // namespace

bool validateAutomation(const TimerList &list, const AutomationDraft &draft,
                        std::string *error) {
  if (draft.name.empty()) {
    setError(error, "Automation needs a name");
    return false;
  }
  if (draft.triggers.empty()) {
    setError(error, "Automation needs a trigger");
    return false;
  }
  if (draft.actions.empty()) {
    setError(error, "Automation needs an action");
    return false;
  }

  for (const auto &trigger : draft.triggers) {
    if (!trigger) {
      setError(error, "Empty trigger");
      return false;
    }
    if (!validateTrigger(list, *trigger, error)) {
      return false;
    }
  }

  for (const auto &action : draft.actions) {
    if (!action) {
      setError(error, "Empty action");
      return false;
    }
    if (!validateAction(list, *action, error)) {
      return false;
    }
  }

  return true;
}

// Lists
std::string Store::createList(const std::string &name, std::string *error) {
  if (name.empty()) {
    setError(error, "List needs a name");
    return "";
  }

  TimerList list;
  list.id = generateId();
  list.name = name;
  list.created_at = WallClock::now();

  std::string id = list.id;
  lists_[id] = std::move(list);
  persist();
  return id;
}

bool Store::renameList(const std::string &list_id, const std::string &name) {
  TimerList *list = findList(list_id);
  if (!list || name.empty()) {
    return false;
  }
  list->name = name;
  persist();
  return true;
}

bool Store::touchList(const std::string &list_id) {
  TimerList *list = findList(list_id);
  if (!list) {
    return false;
  }
  list->has_been_used = true;
  list->last_used_at = WallClock::now();
  persist();
  return true;
}

bool Store::deleteList(const std::string &list_id) {
  // Timers, counters, automations and their triggers/actions live inside
  // the list and go with it
  if (lists_.erase(list_id) == 0) {
    return false;
  }
  persist();
  return true;
}

TimerList *Store::findList(const std::string &list_id) {
  auto it = lists_.find(list_id);
  return it != lists_.end() ? &it->second : nullptr;
}

const TimerList *Store::findList(const std::string &list_id) const {
  auto it = lists_.find(list_id);
  return it != lists_.end() ? &it->second : nullptr;
}

std::vector<const TimerList *> Store::lists() const {
  std::vector<const TimerList *> result;
  for (const auto &pair : lists_) {
    result.push_back(&pair.second);
  }
  std::stable_sort(result.begin(), result.end(),
                   [](const TimerList *a, const TimerList *b) {
                     return a->created_at < b->created_at;
                   });
  return result;
}

// Timers
std::string Store::addTimer(const std::string &list_id,
                            const std::string &name, uint32_t duration_ms,
                            std::string *error) {
  TimerList *list = findList(list_id);
  if (!list) {
    setError(error, "Unknown list");
    return "";
  }
  if (name.empty()) {
    setError(error, "Timer needs a name");
    return "";
  }
  if (duration_ms == 0) {
    setError(error, "Timer duration must be longer than zero");
    return "";
  }

  TimerDefinition timer;
  timer.id = generateId();
  timer.name = name;
  timer.duration_ms = duration_ms;
  timer.order = static_cast<int>(list->timers.size());
  list->timers.push_back(timer);

  persist();
  return timer.id;
}

bool Store::updateTimer(const std::string &timer_id, const std::string &name,
                        uint32_t duration_ms, std::string *error) {
  auto location = locateTimer(timer_id);
  if (!location.item) {
    setError(error, "Unknown timer");
    return false;
  }
  if (name.empty() || duration_ms == 0) {
    setError(error, "Timer needs a name and a duration");
    return false;
  }

  location.item->name = name;
  location.item->duration_ms = duration_ms;
  persist();
  return true;
}

bool Store::removeTimer(const std::string &timer_id) {
  auto location = locateTimer(timer_id);
  if (!location.item) {
    return false;
  }

  auto &timers = location.list->timers;
  timers.erase(timers.begin() + (location.item - timers.data()));
  compactOrder(timers);
  persist();
  return true;
}

bool Store::moveTimer(const std::string &timer_id, size_t to_index) {
  auto location = locateTimer(timer_id);
  if (!location.item ||
      !moveInOrder(location.list->timers, timer_id, to_index)) {
    return false;
  }
  persist();
  return true;
}

const TimerDefinition *Store::findTimer(const std::string &timer_id) const {
  return const_cast<Store *>(this)->locateTimer(timer_id).item;
}

// Counters
std::string Store::addCounter(const std::string &list_id,
                              const Counter &counter, std::string *error) {
  TimerList *list = findList(list_id);
  if (!list) {
    setError(error, "Unknown list");
    return "";
  }
  if (counter.name.empty()) {
    setError(error, "Counter needs a name");
    return "";
  }
  if (!counter.isConsistent()) {
    setError(error, "Counter bounds must contain the initial value");
    return "";
  }

  Counter stored = counter;
  stored.id = generateId();
  stored.value = counter.initial_value;
  stored.order = static_cast<int>(list->counters.size());
  list->counters.push_back(stored);

  persist();
  return stored.id;
}

bool Store::updateCounter(const std::string &counter_id, const Counter &counter,
                          std::string *error) {
  auto location = locateCounter(counter_id);
  if (!location.item) {
    setError(error, "Unknown counter");
    return false;
  }
  if (counter.name.empty()) {
    setError(error, "Counter needs a name");
    return false;
  }
  if (!counter.isConsistent()) {
    setError(error, "Counter bounds must contain the initial value");
    return false;
  }

  Counter &stored = *location.item;
  stored.name = counter.name;
  stored.initial_value = counter.initial_value;
  stored.has_min = counter.has_min;
  stored.min_value = counter.min_value;
  stored.has_max = counter.has_max;
  stored.max_value = counter.max_value;

  // Pull the current value inside the new bounds
  stored.adjust(0);

  persist();
  return true;
}

bool Store::removeCounter(const std::string &counter_id) {
  auto location = locateCounter(counter_id);
  if (!location.item) {
    return false;
  }

  auto &counters = location.list->counters;
  counters.erase(counters.begin() + (location.item - counters.data()));
  compactOrder(counters);
  persist();
  return true;
}

bool Store::moveCounter(const std::string &counter_id, size_t to_index) {
  auto location = locateCounter(counter_id);
  if (!location.item ||
      !moveInOrder(location.list->counters, counter_id, to_index)) {
    return false;
  }
  persist();
  return true;
}

bool Store::resetCounters(const std::string &list_id) {
  TimerList *list = findList(list_id);
  if (!list) {
    return false;
  }
  for (auto &counter : list->counters) {
    counter.reset();
  }
  persist();
  return true;
}

Counter *Store::findCounter(const std::string &counter_id) {
  return locateCounter(counter_id).item;
}

const Counter *Store::findCounter(const std::string &counter_id) const {
  return const_cast<Store *>(this)->locateCounter(counter_id).item;
}

std::vector<Counter *> Store::findCountersByName(const std::string &list_id,
                                                 const std::string &name) {
  std::vector<Counter *> result;
  TimerList *list = findList(list_id);
  if (!list) {
    return result;
  }
  for (auto &counter : list->counters) {
    if (counter.name == name) {
      result.push_back(&counter);
    }
  }
  return result;
}

// Automations
std::string Store::createAutomation(const std::string &list_id,
                                    const AutomationDraft &draft,
                                    std::string *error) {
  TimerList *list = findList(list_id);
  if (!list) {
    setError(error, "Unknown list");
    return "";
  }
  if (!validateAutomation(*list, draft, error)) {
    return "";
  }

  Automation automation;
  automation.id = generateId();
  automation.order = static_cast<int>(list->automations.size());
  automation.created_at = WallClock::now();
  commitDraft(automation, draft);
  list->automations.push_back(automation);

  persist();
  return automation.id;
}

bool Store::updateAutomation(const std::string &automation_id,
                             const AutomationDraft &draft,
                             std::string *error) {
  auto location = locateAutomation(automation_id);
  if (!location.item) {
    setError(error, "Unknown automation");
    return false;
  }
  if (!validateAutomation(*location.list, draft, error)) {
    return false;
  }

  commitDraft(*location.item, draft);
  persist();
  return true;
}

bool Store::setAutomationEnabled(const std::string &automation_id,
                                 bool enabled) {
  auto location = locateAutomation(automation_id);
  if (!location.item) {
    return false;
  }
  location.item->enabled = enabled;
  persist();
  return true;
}

bool Store::removeAutomation(const std::string &automation_id) {
  auto location = locateAutomation(automation_id);
  if (!location.item) {
    return false;
  }

  auto &automations = location.list->automations;
  automations.erase(automations.begin() +
                    (location.item - automations.data()));
  compactOrder(automations);
  persist();
  return true;
}

bool Store::moveAutomation(const std::string &automation_id, size_t to_index) {
  auto location = locateAutomation(automation_id);
  if (!location.item ||
      !moveInOrder(location.list->automations, automation_id, to_index)) {
    return false;
  }
  persist();
  return true;
}

const Automation *
Store::findAutomation(const std::string &automation_id) const {
  return const_cast<Store *>(this)->locateAutomation(automation_id).item;
}

const Trigger *Store::findTrigger(const std::string &trigger_id) const {
  for (const auto &pair : lists_) {
    for (const auto &automation : pair.second.automations) {
      for (const auto &trigger : automation.triggers) {
        if (trigger->id == trigger_id) {
          return trigger.get();
        }
      }
    }
  }
  return nullptr;
}

const Action *Store::findAction(const std::string &action_id) const {
  for (const auto &pair : lists_) {
    for (const auto &automation : pair.second.automations) {
      for (const auto &action : automation.actions) {
        if (action->id == action_id) {
          return action.get();
        }
      }
    }
  }
  return nullptr;
}

std::vector<Automation> Store::automationsFor(const std::string &list_id) const {
  const TimerList *list = findList(list_id);
  if (!list) {
    return {};
  }
  return list->sortedAutomations();
}

bool Store::save() {
  save_count++;
  return saveFunction(*this);
}

void Store::persist() {
  if (!save()) {
    LOG_ERROR("Store save failed, keeping in-memory changes");
  }
}

Store::Location<TimerDefinition>
Store::locateTimer(const std::string &timer_id) {
  Location<TimerDefinition> location;
  for (auto &pair : lists_) {
    for (auto &timer : pair.second.timers) {
      if (timer.id == timer_id) {
        location.list = &pair.second;
        location.item = &timer;
        return location;
      }
    }
  }
  return location;
}

Store::Location<Counter> Store::locateCounter(const std::string &counter_id) {
  Location<Counter> location;
  for (auto &pair : lists_) {
    for (auto &counter : pair.second.counters) {
      if (counter.id == counter_id) {
        location.list = &pair.second;
        location.item = &counter;
        return location;
      }
    }
  }
  return location;
}

Store::Location<Automation>
Store::locateAutomation(const std::string &automation_id) {
  Location<Automation> location;
  for (auto &pair : lists_) {
    for (auto &automation : pair.second.automations) {
      if (automation.id == automation_id) {
        location.list = &pair.second;
        location.item = &automation;
        return location;
      }
    }
  }
  return location;
}

// Old triggers and actions are dropped, the draft's are copied in with new
// ids
void Store::commitDraft(Automation &automation, const AutomationDraft &draft) {
  automation.name = draft.name;
  automation.enabled = draft.enabled;

  automation.triggers.clear();
  for (const auto &trigger : draft.triggers) {
    std::unique_ptr<Trigger> copy = trigger->clone();
    copy->id = generateId();
    automation.triggers.push_back(TriggerPtr(std::move(copy)));
  }

  automation.actions.clear();
  for (const auto &action : draft.actions) {
    std::unique_ptr<Action> copy = action->clone();
    copy->id = generateId();
    automation.actions.push_back(ActionPtr(std::move(copy)));
  }
}

} // namespace tabletimer
