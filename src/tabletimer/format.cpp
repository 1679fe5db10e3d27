#include "tabletimer/format.hpp"
#include <cstdio>

namespace tabletimer {

std::string formatClock(int64_t milliseconds) {
  int64_t total_seconds = milliseconds > 0 ? milliseconds / 1000 : 0;
  int64_t minutes = total_seconds / 60;
  int64_t seconds = total_seconds % 60;

  char buffer[32];
  snprintf(buffer, sizeof(buffer), "%02lld:%02lld",
           static_cast<long long>(minutes), static_cast<long long>(seconds));
  return buffer;
}

std::string formatSeconds(uint32_t milliseconds) {
  std::string result = std::to_string(milliseconds / 1000);
  uint32_t fraction = milliseconds % 1000;
  if (fraction != 0) {
    char buffer[8];
    snprintf(buffer, sizeof(buffer), ".%03u", fraction);
    std::string digits = buffer;
    while (digits.back() == '0') {
      digits.pop_back();
    }
    result += digits;
  }
  return result + "s";
}

} // namespace tabletimer
