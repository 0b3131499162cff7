#ifndef B7E20D64_91F5_4C38_A0B3_5D8C26E4F719
#define B7E20D64_91F5_4C38_A0B3_5D8C26E4F719

#include "events.hpp"
#include "key_map.hpp"
#include <optional>
#include <vector>

namespace tactile::input {

// Platform producer of raw events, drained by the consumer at the start of a tick
struct IRawEventSource {
  virtual ~IRawEventSource() = default;

  // Appends every pending event without blocking
  //   some platforms require this to run on the thread that owns the window
  virtual void drain(std::vector<RawEvent> &outEvents) = 0;

  // Current pointer position, if the platform has a persistent pointer
  virtual std::optional<int2> getPointerPosition() const = 0;

  // Native to canonical code table for the events this source produces
  virtual const KeyMap &getKeyMap() const = 0;

  virtual bool isCloseRequested() const { return false; }
};

} // namespace tactile::input

#endif /* B7E20D64_91F5_4C38_A0B3_5D8C26E4F719 */
