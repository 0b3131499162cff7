#ifndef B2C85E19_7F34_4A6D_9E0B_C3D61A58F247
#define B2C85E19_7F34_4A6D_9E0B_C3D61A58F247

#include "events.hpp"
#include "key_map.hpp"
#include "tracker.hpp"

namespace tactile::input {

// Turns raw platform events into canonical press and release edges on a tracker
struct EventNormalizer {
private:
  KeyMap keyMap;
  PressTracker &tracker;
  // Modifier bits that produced an accepted press
  uint32_t previousModifiers{};

public:
  EventNormalizer(KeyMap keyMap, PressTracker &tracker) : keyMap(std::move(keyMap)), tracker(tracker) {}

  void apply(const RawEvent &event);

  // Forget the last modifier mask, the next mask is diffed against an empty one
  void resetModifiers() { previousModifiers = 0; }

  // Release everything, used when release events may have been missed
  void releaseAll();

  const KeyMap &getKeyMap() const { return keyMap; }

private:
  void applyModifiers(uint32_t modifiers);
  void applyFocus(bool focus);
};

} // namespace tactile::input

#endif /* B2C85E19_7F34_4A6D_9E0B_C3D61A58F247 */
