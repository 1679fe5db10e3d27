#include "tabletimer/format.hpp"
#include "tabletimer/log.hpp"
#include "tabletimer/session.hpp"
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

using namespace tabletimer;

namespace {

struct PlannedTimer {
  std::string name;
  uint32_t duration_ms;
};

bool parseMilliseconds(const char *text, uint32_t *ms) {
  char *end = nullptr;
  double seconds = strtod(text, &end);
  if (end == text || *end != '\0' || seconds <= 0 || seconds > 86400) {
    return false;
  }
  *ms = static_cast<uint32_t>(seconds * 1000);
  return *ms > 0;
}

// "name:seconds"
bool parseTimer(const std::string &arg, PlannedTimer *timer) {
  size_t colon = arg.rfind(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  timer->name = arg.substr(0, colon);
  return parseMilliseconds(arg.c_str() + colon + 1, &timer->duration_ms);
}

TriggerPtr makeRuleTrigger(TriggerType type, const std::string &timer_name) {
  switch (type) {
  case TriggerType::TIMER_START:
    return makeTimerStartTrigger(timer_name);
  case TriggerType::TIMER_END:
    return makeTimerEndTrigger(timer_name);
  case TriggerType::ANY_TIMER_START:
    return makeAnyTimerStartTrigger();
  case TriggerType::ANY_TIMER_END:
    return makeAnyTimerEndTrigger();
  default:
    return nullptr;
  }
}

ActionPtr makeRuleAction(ActionType type, const Trigger &trigger) {
  switch (type) {
  case ActionType::PLAY_SOUND:
    return makePlaySoundAction(Sound::ALERT);
  case ActionType::MODIFY_COUNTER:
    return makeModifyCounterAction("Pulses", 1);
  case ActionType::SHOW_NOTIFICATION:
    return makeShowNotificationAction(describeTrigger(trigger));
  case ActionType::PAUSE_TIMER:
    return makePauseTimerAction();
  case ActionType::SKIP_TIMER:
    return makeSkipTimerAction();
  }
  return nullptr;
}

// "trigger[=timer]:action", e.g. "timer_end=Setup:pause_timer"
bool parseRule(const std::string &arg, AutomationDraft *draft) {
  size_t colon = arg.rfind(':');
  if (colon == std::string::npos) {
    return false;
  }

  std::string trigger_text = arg.substr(0, colon);
  std::string timer_name;
  size_t equals = trigger_text.find('=');
  if (equals != std::string::npos) {
    timer_name = trigger_text.substr(equals + 1);
    trigger_text.resize(equals);
  }

  TriggerType trigger_type;
  ActionType action_type;
  if (!parseTriggerType(trigger_text, &trigger_type) ||
      !parseActionType(arg.substr(colon + 1), &action_type)) {
    return false;
  }

  bool names_timer = trigger_type == TriggerType::TIMER_START ||
                     trigger_type == TriggerType::TIMER_END;
  if (names_timer == timer_name.empty()) {
    return false;
  }

  TriggerPtr trigger = makeRuleTrigger(trigger_type, timer_name);
  if (!trigger) {
    return false;
  }

  draft->name = arg;
  draft->triggers.push_back(trigger);
  draft->actions.push_back(makeRuleAction(action_type, *trigger));
  return true;
}

void usage(const char *program) {
  LOG("Usage: ", program,
      " [--no-autoplay] [--heartbeat MS] [--sound NAME] [--every SECONDS]"
      " [--warn SECONDS] [--on TRIGGER:ACTION]... name:seconds...");
  LOG("  TRIGGER is any_timer_start, any_timer_end, timer_start=NAME or"
      " timer_end=NAME");
  LOG("  ACTION is play_sound, modify_counter, show_notification,"
      " pause_timer or skip_timer");
  LOG("Example: ", program,
      " --every 5 --warn 3 --on timer_end=Setup:pause_timer Setup:10 Turn:20"
      " Scoring:5");
}

} // namespace

int main(int argc, char *argv[]) {
  SessionConfig config;
  uint32_t every_ms = 0;
  uint32_t warn_ms = 0;
  std::vector<PlannedTimer> plan;
  std::vector<AutomationDraft> rules;

  for (int i = 1; i < argc; i++) {
    const char *arg = argv[i];
    bool has_value = i + 1 < argc;

    if (strcmp(arg, "--no-autoplay") == 0) {
      config.autoplay = false;
    } else if (strcmp(arg, "--heartbeat") == 0 && has_value) {
      config.heartbeat_ms = static_cast<uint32_t>(atoi(argv[++i]));
    } else if (strcmp(arg, "--sound") == 0 && has_value) {
      if (!parseSound(argv[++i], &config.completion_sound)) {
        LOG_ERROR("Unknown sound '", argv[i], "'");
        return 1;
      }
    } else if (strcmp(arg, "--every") == 0 && has_value) {
      if (!parseMilliseconds(argv[++i], &every_ms)) {
        LOG_ERROR("Bad interval '", argv[i], "'");
        return 1;
      }
    } else if (strcmp(arg, "--warn") == 0 && has_value) {
      if (!parseMilliseconds(argv[++i], &warn_ms)) {
        LOG_ERROR("Bad warning time '", argv[i], "'");
        return 1;
      }
    } else if (strcmp(arg, "--on") == 0 && has_value) {
      AutomationDraft rule;
      if (!parseRule(argv[++i], &rule)) {
        LOG_ERROR("Bad rule '", argv[i], "'");
        usage(argv[0]);
        return 1;
      }
      rules.push_back(rule);
    } else {
      PlannedTimer timer;
      if (!parseTimer(arg, &timer)) {
        LOG_ERROR("Bad argument '", arg, "'");
        usage(argv[0]);
        return 1;
      }
      plan.push_back(timer);
    }
  }

  if (plan.empty()) {
    usage(argv[0]);
    return 1;
  }

  Store store;
  std::string list_id = store.createList("Command line");
  for (const auto &timer : plan) {
    store.addTimer(list_id, timer.name, timer.duration_ms);
  }

  Counter pulses;
  pulses.name = "Pulses";
  store.addCounter(list_id, pulses);

  std::vector<AutomationDraft> drafts;

  AutomationDraft announce;
  announce.name = "Announce";
  announce.triggers.push_back(makeAnyTimerStartTrigger());
  announce.actions.push_back(makeShowNotificationAction("Next timer is up"));
  drafts.push_back(announce);

  if (every_ms > 0) {
    AutomationDraft pulse;
    pulse.name = "Pulse";
    pulse.triggers.push_back(makeRepeatingIntervalTrigger(every_ms));
    pulse.actions.push_back(makePlaySoundAction(Sound::NOTIFICATION));
    pulse.actions.push_back(makeModifyCounterAction("Pulses", 1));
    drafts.push_back(pulse);
  }

  if (warn_ms > 0) {
    AutomationDraft warn;
    warn.name = "Warning";
    for (const auto &timer : plan) {
      warn.triggers.push_back(makeTimeRemainingTrigger(timer.name, warn_ms));
    }
    warn.actions.push_back(makePlaySoundAction(Sound::ALERT));
    warn.actions.push_back(
        makeShowNotificationAction(formatSeconds(warn_ms) + " left"));
    drafts.push_back(warn);
  }

  drafts.insert(drafts.end(), rules.begin(), rules.end());

  for (const auto &draft : drafts) {
    std::string error;
    std::string id = store.createAutomation(list_id, draft, &error);
    if (id.empty()) {
      LOG_ERROR("Automation '", draft.name, "' rejected: ", error);
      return 1;
    }

    const Automation *automation = store.findAutomation(id);
    LOG("Automation '", automation->name, "':");
    for (const auto &trigger : automation->triggers) {
      LOG("  when ", describeTrigger(*trigger));
    }
    for (const auto &action : automation->actions) {
      LOG("  then ", describeAction(*action));
    }
  }

  Poller poller;
  LogSoundPlayer sound_player;
  LogNotifier notifier;
  Session session(poller, store, sound_player, notifier, config);

  // Leave the loop once the run is over
  TimerSequencer::StateEvent on_stopped = session.getSequencer().onStopped;
  session.getSequencer().onStopped = [&]() {
    on_stopped();
    poller.stop();
  };

  TimerSequencer::TickEvent on_tick = session.getSequencer().onTimerTick;
  uint32_t heartbeat_ms = session.getSequencer().heartbeatMs();
  session.getSequencer().onTimerTick = [&](const TimerDefinition &timer,
                                        int64_t remaining_ms) {
    if (remaining_ms % 1000 < heartbeat_ms) {
      LOG(timer.name, " ", formatClock(remaining_ms));
    }
    on_tick(timer, remaining_ms);
  };

  if (!session.open(list_id) || !session.start()) {
    LOG_ERROR("Nothing to run");
    return 1;
  }

  poller.start();

  const Counter *counter = store.findList(list_id)->findCounterByName("Pulses");
  LOG("Done, ", counter->value, " pulses");
  return 0;
}
