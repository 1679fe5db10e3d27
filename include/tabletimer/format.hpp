#pragma once
#include <cstdint>
#include <string>

namespace tabletimer {

// "05:30" style clock text, whole seconds truncated. Negative input prints
// as 00:00.
std::string formatClock(int64_t milliseconds);

// "10s", "2.5s"
std::string formatSeconds(uint32_t milliseconds);

} // namespace tabletimer
