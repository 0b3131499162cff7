#ifndef C83D5A07_E14B_4B92_A6F8_19D0E7B2C54A
#define C83D5A07_E14B_4B92_A6F8_19D0E7B2C54A

#include "events.hpp"
#include "snapshot.hpp"
#include <core/fmt.hpp>
#include <spdlog/fmt/fmt.h>
#include <magic_enum.hpp>
#include <string>

namespace tactile::input {

inline std::string debugFormat(const RawEvent &event) {
  std::string str = fmt::format("{} {{ code: {}", magic_enum::enum_name(event.kind), event.code);
  if (event.modifiers)
    str += fmt::format(", modifiers: {:#x}", *event.modifiers);
  if (event.kind == RawEventKind::Scroll)
    str += fmt::format(", scroll: {}", event.scroll);
  if (event.pointer)
    str += fmt::format(", pointer: {}", *event.pointer);
  str += " }";
  return str;
}

inline std::string debugFormat(const Snapshot &snapshot) {
  std::string down;
  for (auto &[code, duration] : snapshot.down) {
    if (!down.empty())
      down += ", ";
    if (isReleasedDuration(duration))
      down += fmt::format("{}: released after {}", getInputCodeName(code), heldTicks(duration));
    else
      down += fmt::format("{}: {}", getInputCodeName(code), duration);
  }
  return fmt::format("Snapshot {{ tick: {}, pointer: {}, scroll: {}, focus: {}, resized: {}, down: [{}] }}", snapshot.tick,
                     snapshot.pointer, snapshot.scroll, snapshot.focus, snapshot.resized, down);
}

} // namespace tactile::input

#endif /* C83D5A07_E14B_4B92_A6F8_19D0E7B2C54A */
