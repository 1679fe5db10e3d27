#include "tabletimer/id.hpp"
#include <cctype>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace tabletimer {

namespace {
const char HEX_DIGITS[] = "0123456789abcdef";
}

std::string generateId() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    char reason[256];
    ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
    throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
  }

  // Version 4, variant 10xx
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::string result;
  result.reserve(36);
  for (int i = 0; i < 16; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      result.push_back('-');
    }
    result.push_back(HEX_DIGITS[bytes[i] >> 4]);
    result.push_back(HEX_DIGITS[bytes[i] & 0x0F]);
  }
  return result;
}

bool isValidId(const std::string &id) {
  if (id.size() != 36) {
    return false;
  }
  for (size_t i = 0; i < id.size(); ++i) {
    bool dash_position = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash_position ? id[i] != '-'
                      : !std::isxdigit(static_cast<unsigned char>(id[i]))) {
      return false;
    }
  }
  return true;
}

} // namespace tabletimer
