#pragma once
#include <string>

namespace tabletimer {

// Random RFC 4122 version 4 UUID, lower-case hex with dashes.
// Throws std::runtime_error when the random source is unavailable.
std::string generateId();

bool isValidId(const std::string &id);

} // namespace tabletimer
