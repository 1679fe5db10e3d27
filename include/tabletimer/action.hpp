#pragma once
#include <cstdint>
#include <memory>
#include <string>

namespace tabletimer {

enum class Sound { BELL, CHIME, ALERT, NOTIFICATION, CUSTOM };

const char *soundName(Sound sound);
const char *soundDisplayName(Sound sound);
uint32_t systemSoundId(Sound sound);
bool parseSound(const std::string &name, Sound *sound);

enum class ActionType {
  PLAY_SOUND,
  MODIFY_COUNTER,
  SHOW_NOTIFICATION,
  PAUSE_TIMER,
  SKIP_TIMER
};

// Base of the closed set of action kinds, same layout as Trigger
struct Action {
  ActionType type;
  std::string id;

  virtual ~Action() = default;

  virtual std::unique_ptr<Action> clone() const = 0;

  template <typename T> const T *as() const {
    return type == T::TYPE ? static_cast<const T *>(this) : nullptr;
  }

protected:
  explicit Action(ActionType type) : type(type) {}
  Action(const Action &) = default;
};

template <typename Derived, ActionType Type> struct ActionKind : Action {
  static constexpr ActionType TYPE = Type;

  std::unique_ptr<Action> clone() const override {
    return std::unique_ptr<Action>(
        new Derived(static_cast<const Derived &>(*this)));
  }

protected:
  ActionKind() : Action(Type) {}
};

template <typename Derived, ActionType Type>
constexpr ActionType ActionKind<Derived, Type>::TYPE;

struct PlaySoundAction : ActionKind<PlaySoundAction, ActionType::PLAY_SOUND> {
  Sound sound = Sound::BELL;
};

// Applies delta to every counter of the list named counter_name
struct ModifyCounterAction
    : ActionKind<ModifyCounterAction, ActionType::MODIFY_COUNTER> {
  std::string counter_name;
  int delta = 1;
};

struct ShowNotificationAction
    : ActionKind<ShowNotificationAction, ActionType::SHOW_NOTIFICATION> {
  std::string message;
};

struct PauseTimerAction
    : ActionKind<PauseTimerAction, ActionType::PAUSE_TIMER> {};

struct SkipTimerAction : ActionKind<SkipTimerAction, ActionType::SKIP_TIMER> {};

using ActionPtr = std::shared_ptr<const Action>;

// Factory methods
ActionPtr makePlaySoundAction(Sound sound);
ActionPtr makeModifyCounterAction(const std::string &counter_name, int delta);
ActionPtr makeShowNotificationAction(const std::string &message);
ActionPtr makePauseTimerAction();
ActionPtr makeSkipTimerAction();

const std::string *referencedCounter(const Action &action);

const char *actionTypeName(ActionType type);
const char *actionDisplayName(ActionType type);
bool parseActionType(const std::string &name, ActionType *type);

std::string describeAction(const Action &action);

} // namespace tabletimer
