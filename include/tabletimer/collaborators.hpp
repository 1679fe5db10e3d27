#pragma once
#include "tabletimer/action.hpp"
#include <string>

namespace tabletimer {

// Sound and haptic output. Fire-and-forget.
class SoundPlayer {
public:
  virtual ~SoundPlayer() = default;
  virtual void play(Sound sound) = 0;
};

// User-facing message display. Fire-and-forget.
class Notifier {
public:
  virtual ~Notifier() = default;
  virtual void show(const std::string &message) = 0;
};

// Console stand-ins used by the example program
class LogSoundPlayer : public SoundPlayer {
public:
  void play(Sound sound) override;
};

class LogNotifier : public Notifier {
public:
  void show(const std::string &message) override;
};

} // namespace tabletimer
