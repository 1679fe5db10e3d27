#include "tabletimer/id.hpp"
#include "tabletimer/log.hpp"
#include "tabletimer/store.hpp"
#include <cassert>
#include <set>
#include <string>

using namespace tabletimer;

namespace {

Counter makeCounter(const std::string &name, int initial) {
  Counter counter;
  counter.name = name;
  counter.initial_value = initial;
  return counter;
}

AutomationDraft bellOnEnd(const std::string &timer_name) {
  AutomationDraft draft;
  draft.name = "Bell on " + timer_name;
  draft.triggers.push_back(makeTimerEndTrigger(timer_name));
  draft.actions.push_back(makePlaySoundAction(Sound::BELL));
  return draft;
}

} // namespace

int main() {
  LOG("Test 1: Ids");
  {
    std::set<std::string> ids;
    for (int i = 0; i < 100; i++) {
      std::string id = generateId();
      assert(isValidId(id));
      assert(id[14] == '4');
      ids.insert(id);
    }
    assert(ids.size() == 100);
    assert(!isValidId("not-an-id"));
    LOG("✓ Random version 4 UUIDs");
  }

  LOG("\nTest 2: Timers keep a compact order");
  {
    Store store;
    std::string list_id = store.createList("Game night");
    assert(isValidId(list_id));

    std::string error;
    assert(store.createList("", &error).empty());
    assert(!error.empty());

    std::string a = store.addTimer(list_id, "A", 10000);
    std::string b = store.addTimer(list_id, "B", 5000);
    std::string c = store.addTimer(list_id, "C", 5000);
    assert(store.addTimer(list_id, "D", 0, &error).empty());
    assert(store.addTimer("missing", "D", 1000).empty());

    assert(store.moveTimer(c, 0));
    std::vector<TimerDefinition> sorted = store.findList(list_id)->sortedTimers();
    assert(sorted[0].name == "C" && sorted[1].name == "A" &&
           sorted[2].name == "B");
    LOG("✓ Move reorders");

    assert(store.removeTimer(a));
    assert(store.findTimer(a) == nullptr);
    assert(store.findTimer(c)->order == 0);
    assert(store.findTimer(b)->order == 1);
    LOG("✓ Orders compacted after removal");

    assert(store.updateTimer(b, "Bonus", 7000));
    assert(store.findTimer(b)->name == "Bonus");
    assert(!store.updateTimer(b, "", 7000));
    LOG("✓ Update validates name and duration");
  }

  LOG("\nTest 3: Counters");
  {
    Store store;
    std::string list_id = store.createList("Scores");

    Counter lives = makeCounter("Lives", 3);
    lives.has_min = true;
    lives.min_value = 0;
    lives.has_max = true;
    lives.max_value = 5;
    lives.value = 99;
    std::string lives_id = store.addCounter(list_id, lives);
    assert(store.findCounter(lives_id)->value == 3);
    LOG("✓ New counter starts at its initial value");

    Counter broken = makeCounter("Broken", 10);
    broken.has_max = true;
    broken.max_value = 5;
    std::string error;
    assert(store.addCounter(list_id, broken, &error).empty());
    assert(!error.empty());
    LOG("✓ Initial value outside the bounds refused");

    store.findCounter(lives_id)->value = 5;
    Counter narrower = *store.findCounter(lives_id);
    narrower.max_value = 4;
    narrower.initial_value = 2;
    assert(store.updateCounter(lives_id, narrower));
    assert(store.findCounter(lives_id)->value == 4);
    LOG("✓ Narrowing bounds clamps the current value");

    store.addCounter(list_id, makeCounter("Lives", 0));
    assert(store.findCountersByName(list_id, "Lives").size() == 2);
    assert(store.findCountersByName(list_id, "Nobody").empty());

    assert(store.resetCounters(list_id));
    assert(store.findCounter(lives_id)->value == 2);
    LOG("✓ Reset all counters of the list");
  }

  LOG("\nTest 4: Automation validation");
  {
    Store store;
    std::string list_id = store.createList("Rules");
    store.addTimer(list_id, "Round", 60000);
    store.addCounter(list_id, makeCounter("Score", 0));
    std::string error;

    AutomationDraft unnamed = bellOnEnd("Round");
    unnamed.name = "";
    assert(store.createAutomation(list_id, unnamed, &error).empty());

    AutomationDraft no_actions = bellOnEnd("Round");
    no_actions.actions.clear();
    assert(store.createAutomation(list_id, no_actions, &error).empty());

    AutomationDraft unknown_timer = bellOnEnd("Overtime");
    assert(store.createAutomation(list_id, unknown_timer, &error).empty());
    assert(error.find("Overtime") != std::string::npos);

    AutomationDraft unknown_counter = bellOnEnd("Round");
    unknown_counter.actions.push_back(makeModifyCounterAction("Fouls", 1));
    assert(store.createAutomation(list_id, unknown_counter, &error).empty());

    AutomationDraft empty_message = bellOnEnd("Round");
    empty_message.actions.push_back(makeShowNotificationAction(""));
    assert(store.createAutomation(list_id, empty_message, &error).empty());

    AutomationDraft zero_interval = bellOnEnd("Round");
    zero_interval.triggers.push_back(makeRepeatingIntervalTrigger(0));
    assert(store.createAutomation(list_id, zero_interval, &error).empty());

    assert(store.findList(list_id)->automations.empty());
    LOG("✓ Incomplete automations are never saved");

    AutomationDraft valid = bellOnEnd("Round");
    valid.actions.push_back(makeModifyCounterAction("Score", 1));
    assert(!store.createAutomation(list_id, valid, &error).empty());
    LOG("✓ Complete automation saved");
  }

  LOG("\nTest 5: Editing an automation replaces its triggers and actions");
  {
    Store store;
    std::string list_id = store.createList("Rules");
    store.addTimer(list_id, "Round", 60000);

    std::string id = store.createAutomation(list_id, bellOnEnd("Round"));
    const Automation *automation = store.findAutomation(id);
    std::string old_trigger = automation->triggers[0]->id;
    std::string old_action = automation->actions[0]->id;
    assert(store.findTrigger(old_trigger) != nullptr);

    AutomationDraft edit;
    edit.name = "Warning";
    edit.triggers.push_back(makeTimeRemainingTrigger("Round", 10000));
    edit.actions.push_back(makeShowNotificationAction("10 seconds left"));
    edit.actions.push_back(makePlaySoundAction(Sound::ALERT));
    assert(store.updateAutomation(id, edit));

    automation = store.findAutomation(id);
    assert(automation->name == "Warning");
    assert(automation->actions.size() == 2);
    assert(store.findTrigger(old_trigger) == nullptr);
    assert(store.findAction(old_action) == nullptr);
    assert(isValidId(automation->triggers[0]->id));
    LOG("✓ Old children gone, new ones have fresh ids");

    assert(describeTrigger(*automation->triggers[0]) ==
           "10s before 'Round' ends");
    assert(describeAction(*automation->actions[1]) == "Play Sound (Alert)");

    assert(store.setAutomationEnabled(id, false));
    assert(!store.findAutomation(id)->enabled);
    LOG("✓ Enable flag toggled");

    std::string second = store.createAutomation(list_id, bellOnEnd("Round"));
    assert(store.moveAutomation(second, 0));
    assert(store.automationsFor(list_id)[0].id == second);
    assert(store.removeAutomation(second));
    assert(store.findAutomation(id)->order == 0);
    LOG("✓ Automations ordered, moved and removed");
  }

  LOG("\nTest 6: Deleting a list removes everything in it");
  {
    Store store;
    std::string keep_id = store.createList("Keep");
    std::string list_id = store.createList("Doomed");
    std::string timer_id = store.addTimer(list_id, "Round", 1000);
    std::string counter_id = store.addCounter(list_id, makeCounter("Score", 0));

    AutomationDraft draft = bellOnEnd("Round");
    draft.actions.push_back(makeModifyCounterAction("Score", 1));
    std::string automation_id = store.createAutomation(list_id, draft);
    const Automation *automation = store.findAutomation(automation_id);
    std::string trigger_id = automation->triggers[0]->id;
    std::string action_id = automation->actions[1]->id;

    assert(store.deleteList(list_id));
    assert(store.findList(list_id) == nullptr);
    assert(store.findTimer(timer_id) == nullptr);
    assert(store.findCounter(counter_id) == nullptr);
    assert(store.findAutomation(automation_id) == nullptr);
    assert(store.findTrigger(trigger_id) == nullptr);
    assert(store.findAction(action_id) == nullptr);
    assert(store.automationsFor(list_id).empty());
    assert(store.lists().size() == 1 && store.lists()[0]->id == keep_id);
    assert(!store.deleteList(list_id));
    LOG("✓ No timer, counter, automation, trigger or action left behind");
  }

  LOG("\nTest 7: Failed saves keep the change");
  {
    Store store;
    int attempts = 0;
    store.saveFunction = [&](const Store &) {
      attempts++;
      return false;
    };

    std::string list_id = store.createList("Offline");
    assert(!list_id.empty());
    assert(store.findList(list_id) != nullptr);
    assert(store.renameList(list_id, "Still offline"));
    assert(store.findList(list_id)->name == "Still offline");
    assert(attempts == 2);
    assert(store.saveCount() == 2);
    LOG("✓ Mutation applied even though the save failed");

    assert(store.touchList(list_id));
    assert(store.findList(list_id)->has_been_used);
    LOG("✓ Opening stamps the list as used");
  }

  LOG("\nAll store tests passed!");
  return 0;
}
