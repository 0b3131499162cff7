#ifndef C6E1A94F_27B3_4D85_A0F9_3B8D52E7C410
#define C6E1A94F_27B3_4D85_A0F9_3B8D52E7C410

#include <cstdint>
#include <optional>
#include <string_view>
#include <linalg.h>
#include <magic_enum.hpp>

namespace tactile::input {
using namespace linalg::aliases;

// Platform independent identifier for one physical key, button or modifier
//   each category occupies its own range so codes never collide across categories
enum class InputCode : uint16_t {
  Digit0 = 0x10,
  Digit1,
  Digit2,
  Digit3,
  Digit4,
  Digit5,
  Digit6,
  Digit7,
  Digit8,
  Digit9,

  A = 0x20,
  B,
  C,
  D,
  E,
  F,
  G,
  H,
  I,
  J,
  K,
  L,
  M,
  N,
  O,
  P,
  Q,
  R,
  S,
  T,
  U,
  V,
  W,
  X,
  Y,
  Z,

  F1 = 0x40,
  F2,
  F3,
  F4,
  F5,
  F6,
  F7,
  F8,
  F9,
  F10,
  F11,
  F12,
  F13,
  F14,
  F15,
  F16,
  F17,
  F18,
  F19,
  F20,

  Keypad0 = 0x60,
  Keypad1,
  Keypad2,
  Keypad3,
  Keypad4,
  Keypad5,
  Keypad6,
  Keypad7,
  Keypad8,
  Keypad9,
  KeypadDecimal,
  KeypadMultiply,
  KeypadPlus,
  KeypadClear,
  KeypadDivide,
  KeypadEnter,
  KeypadMinus,
  KeypadEquals,

  Equal = 0x80,
  Minus,
  RightBracket,
  LeftBracket,
  Quote,
  Semicolon,
  Backslash,
  Comma,
  Slash,
  Period,
  Grave,
  Return,
  Tab,
  Space,
  Backspace,
  Delete,
  Escape,
  Insert,
  CapsLock,
  PrintScreen,
  Pause,

  Home = 0xA0,
  End,
  PageUp,
  PageDown,
  Left,
  Right,
  Up,
  Down,
  Help,
  Menu,

  Control = 0xC0,
  Function,
  Shift,
  Command,
  Alt,

  MouseLeft = 0xE0,
  MouseMiddle,
  MouseRight,
  Touch,
};

enum class InputCategory : uint8_t {
  Digit,
  Letter,
  FunctionKey,
  Keypad,
  Editing,
  Navigation,
  Modifier,
  Pointer,
};

// Added to a hold duration on release, the held tick count stays recoverable as (value - ReleasedSentinel)
//   at 60 polls per second a key would need to be held for about 190 days to reach it
inline constexpr int32_t ReleasedSentinel = -1'000'000'000;

constexpr bool isReleasedDuration(int32_t duration) { return duration < 0; }

// Ticks a code was held for, for both held and released durations
constexpr int32_t heldTicks(int32_t duration) { return duration < 0 ? duration - ReleasedSentinel : duration; }

constexpr InputCategory getInputCodeCategory(InputCode code) {
  auto value = uint16_t(code);
  if (value >= 0xE0)
    return InputCategory::Pointer;
  if (value >= 0xC0)
    return InputCategory::Modifier;
  if (value >= 0xA0)
    return InputCategory::Navigation;
  if (value >= 0x80)
    return InputCategory::Editing;
  if (value >= 0x60)
    return InputCategory::Keypad;
  if (value >= 0x40)
    return InputCategory::FunctionKey;
  if (value >= 0x20)
    return InputCategory::Letter;
  return InputCategory::Digit;
}

constexpr bool isModifier(InputCode code) { return getInputCodeCategory(code) == InputCategory::Modifier; }

std::string_view getInputCodeName(InputCode code);
std::optional<InputCode> parseInputCode(std::string_view name);
} // namespace tactile::input

namespace magic_enum::customize {
template <> struct enum_range<tactile::input::InputCode> {
  static constexpr int min = 0;
  static constexpr int max = 255;
};
} // namespace magic_enum::customize

#endif /* C6E1A94F_27B3_4D85_A0F9_3B8D52E7C410 */
