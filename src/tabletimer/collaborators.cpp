#include "tabletimer/collaborators.hpp"
#include "tabletimer/log.hpp"

namespace tabletimer {

void LogSoundPlayer::play(Sound sound) {
  LOG("♪ ", soundDisplayName(sound), " (system sound ", systemSoundId(sound),
      ")");
}

void LogNotifier::show(const std::string &message) {
  LOG("[Automation] ", message);
}

} // namespace tabletimer
