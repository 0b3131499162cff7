#ifndef A7D2E05C_4B19_4F63_8C2A_E9F1B6037D58
#define A7D2E05C_4B19_4F63_8C2A_E9F1B6037D58

#include "input.hpp"
#include <cstdint>
#include <optional>

namespace tactile::input {

enum class RawEventKind : uint8_t {
  None,
  KeyDown,
  KeyUp,
  MouseDown,
  MouseUp,
  MouseMove,
  Scroll,
  TouchBegin,
  TouchMove,
  TouchEnd,
  Resized,
  Moved,
  Iconified,
  Uniconified,
  FocusGained,
  FocusLost,
  CloseRequested,
};

// One notification as produced by a platform event source
//   code holds a native key or button code and is translated through a KeyMap
//   modifiers holds the native combined modifier mask, left empty when the platform event carries none
struct RawEvent {
  RawEventKind kind{};
  int32_t code{};
  std::optional<uint32_t> modifiers;
  float scroll{};
  std::optional<int2> pointer;

  bool operator==(const RawEvent &other) const = default;
};

} // namespace tactile::input

#endif /* A7D2E05C_4B19_4F63_8C2A_E9F1B6037D58 */
