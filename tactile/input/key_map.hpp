#ifndef B58F3C71_D0A4_4E92_91B7_6C2E8F4A03D9
#define B58F3C71_D0A4_4E92_91B7_6C2E8F4A03D9

#include "input.hpp"
#include <cstdint>
#include <optional>
#include <initializer_list>
#include <utility>
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>

namespace tactile::input {

// Native modifier mask bits that correspond to one canonical modifier
//   mask may contain several bits, e.g. left and right shift
struct ModifierMapping {
  uint32_t mask{};
  InputCode code{};
};

// Translation table from one platform's native codes to canonical codes
struct KeyMap {
  boost::container::flat_map<int32_t, InputCode> keys;
  boost::container::flat_map<int32_t, InputCode> buttons;
  boost::container::small_vector<ModifierMapping, 8> modifiers;

  KeyMap() = default;
  KeyMap(std::initializer_list<std::pair<int32_t, InputCode>> keys,
         std::initializer_list<std::pair<int32_t, InputCode>> buttons,
         std::initializer_list<ModifierMapping> modifiers);

  std::optional<InputCode> translateKey(int32_t nativeKey) const;
  std::optional<InputCode> translateButton(int32_t nativeButton) const;
  // Mask bits of a canonical modifier, empty for codes that are not modifiers
  std::optional<uint32_t> getModifierMask(InputCode code) const;

  // Later mappings for the same native code replace earlier ones
  KeyMap &mapKey(int32_t nativeKey, InputCode code);
  KeyMap &mapButton(int32_t nativeButton, InputCode code);
  KeyMap &mapModifier(uint32_t mask, InputCode code);

  // Windows virtual-key codes, VK_*BUTTON ids and the window layer's modifier bits
  static const KeyMap &win32();
  // macOS virtual key codes, NSEvent button numbers and NSEvent modifier flags
  static const KeyMap &darwin();
};

} // namespace tactile::input

#endif /* B58F3C71_D0A4_4E92_91B7_6C2E8F4A03D9 */
