#include "tabletimer/counter.hpp"
#include <limits>

namespace tabletimer {

void Counter::increment() {
  if (!canIncrement()) {
    return;
  }
  value += 1;
}

void Counter::decrement() {
  if (!canDecrement()) {
    return;
  }
  value -= 1;
}

void Counter::reset() { value = initial_value; }

void Counter::adjust(int delta) {
  int64_t next = static_cast<int64_t>(value) + delta;

  if (has_min && next < min_value) {
    next = min_value;
  } else if (has_max && next > max_value) {
    next = max_value;
  }

  // Unbounded counters still saturate at the int range
  if (next > std::numeric_limits<int>::max()) {
    next = std::numeric_limits<int>::max();
  } else if (next < std::numeric_limits<int>::min()) {
    next = std::numeric_limits<int>::min();
  }

  value = static_cast<int>(next);
}

bool Counter::canIncrement() const {
  if (!has_max) {
    return value < std::numeric_limits<int>::max();
  }
  return value < max_value;
}

bool Counter::canDecrement() const {
  if (!has_min) {
    return value > std::numeric_limits<int>::min();
  }
  return value > min_value;
}

bool Counter::isConsistent() const {
  if (has_min && has_max && min_value > max_value) {
    return false;
  }
  if (has_min && initial_value < min_value) {
    return false;
  }
  if (has_max && initial_value > max_value) {
    return false;
  }
  return true;
}

} // namespace tabletimer
