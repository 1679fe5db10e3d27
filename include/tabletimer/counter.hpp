#pragma once
#include <cstdint>
#include <string>

namespace tabletimer {

// Bounded integer. Mutators only touch value; whoever calls them raises the
// counter-change event with the old and new value.
struct Counter {
  std::string id;
  std::string name;
  int value = 0;
  int initial_value = 0;

  bool has_min = false;
  int min_value = 0;
  bool has_max = false;
  int max_value = 0;

  int order = 0;

  void increment();
  void decrement();
  void reset();

  // value = clamp(value + delta, min, max) against the bounds that are set
  void adjust(int delta);

  bool canIncrement() const;
  bool canDecrement() const;

  // Bounds are ordered and the initial value sits inside them
  bool isConsistent() const;
};

} // namespace tabletimer
