#include "key_map.hpp"

namespace tactile::input {
KeyMap::KeyMap(std::initializer_list<std::pair<int32_t, InputCode>> keys,
               std::initializer_list<std::pair<int32_t, InputCode>> buttons,
               std::initializer_list<ModifierMapping> modifiers) {
  for (auto &[native, code] : keys)
    mapKey(native, code);
  for (auto &[native, code] : buttons)
    mapButton(native, code);
  for (auto &mapping : modifiers)
    mapModifier(mapping.mask, mapping.code);
}

std::optional<InputCode> KeyMap::translateKey(int32_t nativeKey) const {
  auto it = keys.find(nativeKey);
  if (it == keys.end())
    return std::nullopt;
  return it->second;
}

std::optional<InputCode> KeyMap::translateButton(int32_t nativeButton) const {
  auto it = buttons.find(nativeButton);
  if (it == buttons.end())
    return std::nullopt;
  return it->second;
}

KeyMap &KeyMap::mapKey(int32_t nativeKey, InputCode code) {
  keys.insert_or_assign(nativeKey, code);
  return *this;
}

KeyMap &KeyMap::mapButton(int32_t nativeButton, InputCode code) {
  buttons.insert_or_assign(nativeButton, code);
  return *this;
}

KeyMap &KeyMap::mapModifier(uint32_t mask, InputCode code) {
  for (auto &mapping : modifiers) {
    if (mapping.code == code) {
      mapping.mask = mask;
      return *this;
    }
  }
  modifiers.push_back(ModifierMapping{.mask = mask, .code = code});
  return *this;
}

std::optional<uint32_t> KeyMap::getModifierMask(InputCode code) const {
  for (auto &mapping : modifiers) {
    if (mapping.code == code)
      return mapping.mask;
  }
  return std::nullopt;
}

const KeyMap &KeyMap::win32() {
  using IC = InputCode;
  static const KeyMap map{
      {
          {0x30, IC::Digit0},        {0x31, IC::Digit1},       {0x32, IC::Digit2},        {0x33, IC::Digit3},
          {0x34, IC::Digit4},        {0x35, IC::Digit5},       {0x36, IC::Digit6},        {0x37, IC::Digit7},
          {0x38, IC::Digit8},        {0x39, IC::Digit9},       {0x41, IC::A},             {0x42, IC::B},
          {0x43, IC::C},             {0x44, IC::D},            {0x45, IC::E},             {0x46, IC::F},
          {0x47, IC::G},             {0x48, IC::H},            {0x49, IC::I},             {0x4A, IC::J},
          {0x4B, IC::K},             {0x4C, IC::L},            {0x4D, IC::M},             {0x4E, IC::N},
          {0x4F, IC::O},             {0x50, IC::P},            {0x51, IC::Q},             {0x52, IC::R},
          {0x53, IC::S},             {0x54, IC::T},            {0x55, IC::U},             {0x56, IC::V},
          {0x57, IC::W},             {0x58, IC::X},            {0x59, IC::Y},             {0x5A, IC::Z},
          {0x70, IC::F1},            {0x71, IC::F2},           {0x72, IC::F3},            {0x73, IC::F4},
          {0x74, IC::F5},            {0x75, IC::F6},           {0x76, IC::F7},            {0x77, IC::F8},
          {0x78, IC::F9},            {0x79, IC::F10},          {0x7A, IC::F11},           {0x7B, IC::F12},
          {0x7C, IC::F13},           {0x7D, IC::F14},          {0x7E, IC::F15},           {0x7F, IC::F16},
          {0x80, IC::F17},           {0x81, IC::F18},          {0x82, IC::F19},           {0x83, IC::F20},
          {0x60, IC::Keypad0},       {0x61, IC::Keypad1},      {0x62, IC::Keypad2},       {0x63, IC::Keypad3},
          {0x64, IC::Keypad4},       {0x65, IC::Keypad5},      {0x66, IC::Keypad6},       {0x67, IC::Keypad7},
          {0x68, IC::Keypad8},       {0x69, IC::Keypad9},      {0x6E, IC::KeypadDecimal}, {0x6A, IC::KeypadMultiply},
          {0x6B, IC::KeypadPlus},    {0x0C, IC::KeypadClear},  {0x6F, IC::KeypadDivide},  {0x6D, IC::KeypadMinus},
          {0xBB, IC::Equal},         {0xBD, IC::Minus},        {0xDB, IC::LeftBracket},   {0xDD, IC::RightBracket},
          {0xDE, IC::Quote},         {0xBA, IC::Semicolon},    {0xDC, IC::Backslash},     {0xC0, IC::Grave},
          {0xBF, IC::Slash},         {0xBC, IC::Comma},        {0xBE, IC::Period},        {0x0D, IC::Return},
          {0x09, IC::Tab},           {0x20, IC::Space},        {0x08, IC::Backspace},     {0x2E, IC::Delete},
          {0x1B, IC::Escape},        {0x2D, IC::Insert},       {0x14, IC::CapsLock},      {0x2C, IC::PrintScreen},
          {0x13, IC::Pause},         {0x24, IC::Home},         {0x23, IC::End},           {0x21, IC::PageUp},
          {0x22, IC::PageDown},      {0x25, IC::Left},         {0x27, IC::Right},         {0x26, IC::Up},
          {0x28, IC::Down},          {0x2F, IC::Help},         {0x5D, IC::Menu},          {0x10, IC::Shift},
          {0x11, IC::Control},       {0x12, IC::Alt},          {0x5B, IC::Command},       {0x5C, IC::Command},
      },
      {
          {0x01, IC::MouseLeft},
          {0x02, IC::MouseRight},
          {0x04, IC::MouseMiddle},
      },
      {
          {.mask = 1u << 17, .code = IC::Shift},
          {.mask = 1u << 18, .code = IC::Control},
          {.mask = 1u << 19, .code = IC::Command},
          {.mask = 1u << 20, .code = IC::Function},
          {.mask = 1u << 21, .code = IC::Alt},
      },
  };
  return map;
}

const KeyMap &KeyMap::darwin() {
  using IC = InputCode;
  static const KeyMap map{
      {
          {0x1D, IC::Digit0},        {0x12, IC::Digit1},         {0x13, IC::Digit2},        {0x14, IC::Digit3},
          {0x15, IC::Digit4},        {0x17, IC::Digit5},         {0x16, IC::Digit6},        {0x1A, IC::Digit7},
          {0x1C, IC::Digit8},        {0x19, IC::Digit9},         {0x00, IC::A},             {0x0B, IC::B},
          {0x08, IC::C},             {0x02, IC::D},              {0x0E, IC::E},             {0x03, IC::F},
          {0x05, IC::G},             {0x04, IC::H},              {0x22, IC::I},             {0x26, IC::J},
          {0x28, IC::K},             {0x25, IC::L},              {0x2E, IC::M},             {0x2D, IC::N},
          {0x1F, IC::O},             {0x23, IC::P},              {0x0C, IC::Q},             {0x0F, IC::R},
          {0x01, IC::S},             {0x11, IC::T},              {0x20, IC::U},             {0x09, IC::V},
          {0x0D, IC::W},             {0x07, IC::X},              {0x10, IC::Y},             {0x06, IC::Z},
          {0x7A, IC::F1},            {0x78, IC::F2},             {0x63, IC::F3},            {0x76, IC::F4},
          {0x60, IC::F5},            {0x61, IC::F6},             {0x62, IC::F7},            {0x64, IC::F8},
          {0x65, IC::F9},            {0x6D, IC::F10},            {0x67, IC::F11},           {0x6F, IC::F12},
          {0x69, IC::F13},           {0x6B, IC::F14},            {0x71, IC::F15},           {0x6A, IC::F16},
          {0x40, IC::F17},           {0x4F, IC::F18},            {0x50, IC::F19},           {0x5A, IC::F20},
          {0x52, IC::Keypad0},       {0x53, IC::Keypad1},        {0x54, IC::Keypad2},       {0x55, IC::Keypad3},
          {0x56, IC::Keypad4},       {0x57, IC::Keypad5},        {0x58, IC::Keypad6},       {0x59, IC::Keypad7},
          {0x5B, IC::Keypad8},       {0x5C, IC::Keypad9},        {0x41, IC::KeypadDecimal}, {0x43, IC::KeypadMultiply},
          {0x45, IC::KeypadPlus},    {0x47, IC::KeypadClear},    {0x4B, IC::KeypadDivide},  {0x4C, IC::KeypadEnter},
          {0x4E, IC::KeypadMinus},   {0x51, IC::KeypadEquals},   {0x18, IC::Equal},         {0x1B, IC::Minus},
          {0x1E, IC::RightBracket},  {0x21, IC::LeftBracket},    {0x27, IC::Quote},         {0x29, IC::Semicolon},
          {0x2A, IC::Backslash},     {0x2B, IC::Comma},          {0x2C, IC::Slash},         {0x2F, IC::Period},
          {0x32, IC::Grave},         {0x24, IC::Return},         {0x30, IC::Tab},           {0x31, IC::Space},
          {0x33, IC::Backspace},     {0x75, IC::Delete},         {0x35, IC::Escape},        {0x39, IC::CapsLock},
          {0x73, IC::Home},          {0x77, IC::End},            {0x74, IC::PageUp},        {0x79, IC::PageDown},
          {0x7B, IC::Left},          {0x7C, IC::Right},          {0x7E, IC::Up},            {0x7D, IC::Down},
          {0x72, IC::Help},          {0x37, IC::Command},        {0x36, IC::Command},       {0x38, IC::Shift},
          {0x3C, IC::Shift},         {0x3A, IC::Alt},            {0x3D, IC::Alt},           {0x3B, IC::Control},
          {0x3E, IC::Control},       {0x3F, IC::Function},
      },
      {
          {0, IC::MouseLeft},
          {1, IC::MouseRight},
          {2, IC::MouseMiddle},
      },
      {
          {.mask = 1u << 17, .code = IC::Shift},
          {.mask = 1u << 18, .code = IC::Control},
          {.mask = 1u << 19, .code = IC::Alt},
          {.mask = 1u << 20, .code = IC::Command},
          {.mask = 1u << 23, .code = IC::Function},
      },
  };
  return map;
}
} // namespace tactile::input
