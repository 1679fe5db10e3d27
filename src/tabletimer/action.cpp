#include "tabletimer/action.hpp"
#include <sstream>

namespace tabletimer {

namespace {

struct SoundEntry {
  Sound sound;
  const char *name;
  const char *display_name;
  uint32_t system_id;
};

const SoundEntry SOUNDS[] = {
    {Sound::BELL, "bell", "Bell", 1005},
    {Sound::CHIME, "chime", "Chime", 1016},
    {Sound::ALERT, "alert", "Alert", 1007},
    {Sound::NOTIFICATION, "notification", "Notification", 1003},
    {Sound::CUSTOM, "custom", "Custom", 1005}, // plays the bell for now
};

const SoundEntry &soundEntry(Sound sound) {
  for (const auto &entry : SOUNDS) {
    if (entry.sound == sound) {
      return entry;
    }
  }
  return SOUNDS[0];
}

struct ActionTypeEntry {
  ActionType type;
  const char *name;
  const char *display_name;
};

const ActionTypeEntry ACTION_TYPES[] = {
    {ActionType::PLAY_SOUND, "play_sound", "Play Sound"},
    {ActionType::MODIFY_COUNTER, "modify_counter", "Modify Counter"},
    {ActionType::SHOW_NOTIFICATION, "show_notification", "Show Notification"},
    {ActionType::PAUSE_TIMER, "pause_timer", "Pause Timer"},
    {ActionType::SKIP_TIMER, "skip_timer", "Skip to Next Timer"},
};

} // namespace

const char *soundName(Sound sound) { return soundEntry(sound).name; }

const char *soundDisplayName(Sound sound) {
  return soundEntry(sound).display_name;
}

uint32_t systemSoundId(Sound sound) { return soundEntry(sound).system_id; }

bool parseSound(const std::string &name, Sound *sound) {
  for (const auto &entry : SOUNDS) {
    if (name == entry.name) {
      *sound = entry.sound;
      return true;
    }
  }
  return false;
}

ActionPtr makePlaySoundAction(Sound sound) {
  auto action = std::make_shared<PlaySoundAction>();
  action->sound = sound;
  return action;
}

ActionPtr makeModifyCounterAction(const std::string &counter_name, int delta) {
  auto action = std::make_shared<ModifyCounterAction>();
  action->counter_name = counter_name;
  action->delta = delta;
  return action;
}

ActionPtr makeShowNotificationAction(const std::string &message) {
  auto action = std::make_shared<ShowNotificationAction>();
  action->message = message;
  return action;
}

ActionPtr makePauseTimerAction() {
  return std::make_shared<PauseTimerAction>();
}

ActionPtr makeSkipTimerAction() { return std::make_shared<SkipTimerAction>(); }

const std::string *referencedCounter(const Action &action) {
  if (auto modify = action.as<ModifyCounterAction>()) {
    return &modify->counter_name;
  }
  return nullptr;
}

const char *actionTypeName(ActionType type) {
  for (const auto &entry : ACTION_TYPES) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

const char *actionDisplayName(ActionType type) {
  for (const auto &entry : ACTION_TYPES) {
    if (entry.type == type) {
      return entry.display_name;
    }
  }
  return "Unknown";
}

bool parseActionType(const std::string &name, ActionType *type) {
  for (const auto &entry : ACTION_TYPES) {
    if (name == entry.name) {
      *type = entry.type;
      return true;
    }
  }
  return false;
}

std::string describeAction(const Action &action) {
  std::ostringstream oss;
  oss << actionDisplayName(action.type);

  switch (action.type) {
  case ActionType::PLAY_SOUND:
    oss << " (" << soundDisplayName(action.as<PlaySoundAction>()->sound)
        << ")";
    break;
  case ActionType::MODIFY_COUNTER: {
    auto modify = action.as<ModifyCounterAction>();
    oss << " (" << modify->counter_name << " " << (modify->delta >= 0 ? "+" : "")
        << modify->delta << ")";
    break;
  }
  case ActionType::SHOW_NOTIFICATION:
    oss << " (\"" << action.as<ShowNotificationAction>()->message << "\")";
    break;
  case ActionType::PAUSE_TIMER:
  case ActionType::SKIP_TIMER:
    break;
  }

  return oss.str();
}

} // namespace tabletimer
