#include "normalizer.hpp"
#include "debug.hpp"
#include "log.hpp"

namespace tactile::input {

static auto logger = getLogger();

void EventNormalizer::apply(const RawEvent &event) {
  if (event.kind != RawEventKind::MouseMove && event.kind != RawEventKind::TouchMove)
    SPDLOG_LOGGER_DEBUG(logger, "Raw event: {}", debugFormat(event));

  if (event.pointer)
    tracker.setPointer(*event.pointer);

  if (event.modifiers)
    applyModifiers(*event.modifiers);

  auto translated = [&](std::optional<InputCode> code) {
    if (!code)
      SPDLOG_LOGGER_TRACE(logger, "Dropping unmapped native code {} ({})", event.code, magic_enum::enum_name(event.kind));
    return code;
  };

  switch (event.kind) {
  case RawEventKind::KeyDown:
    if (auto code = translated(keyMap.translateKey(event.code)))
      tracker.recordPress(*code);
    break;
  case RawEventKind::KeyUp:
    if (auto code = translated(keyMap.translateKey(event.code))) {
      // Left and right keys share one modifier, it stays down while the mask still reports it
      auto mask = keyMap.getModifierMask(*code);
      if (mask && event.modifiers && (*event.modifiers & *mask) != 0)
        break;
      tracker.recordRelease(*code);
    }
    break;
  case RawEventKind::MouseDown:
    if (auto code = translated(keyMap.translateButton(event.code)))
      tracker.recordPress(*code);
    break;
  case RawEventKind::MouseUp:
    if (auto code = translated(keyMap.translateButton(event.code)))
      tracker.recordRelease(*code);
    break;
  case RawEventKind::TouchBegin:
    tracker.recordPress(InputCode::Touch);
    break;
  case RawEventKind::TouchEnd:
    tracker.recordRelease(InputCode::Touch);
    break;
  case RawEventKind::Scroll:
    tracker.addScroll(event.scroll);
    break;
  case RawEventKind::Resized:
  case RawEventKind::Moved:
    tracker.markResized();
    break;
  case RawEventKind::FocusLost:
  case RawEventKind::Iconified:
    applyFocus(false);
    break;
  case RawEventKind::FocusGained:
  case RawEventKind::Uniconified:
    applyFocus(true);
    break;
  case RawEventKind::MouseMove:
  case RawEventKind::TouchMove:
  case RawEventKind::CloseRequested:
  case RawEventKind::None:
    break;
  }
}

void EventNormalizer::releaseAll() {
  tracker.releaseAll();
  resetModifiers();
}

void EventNormalizer::applyModifiers(uint32_t modifiers) {
  uint32_t accepted{};
  for (auto &mapping : keyMap.modifiers) {
    bool isSet = (modifiers & mapping.mask) != 0;
    bool wasSet = (previousModifiers & mapping.mask) != 0;
    if (isSet) {
      if (!wasSet)
        tracker.recordPress(mapping.code);
      // Presses rejected while unfocused are retried with the next mask
      if (tracker.isDown(mapping.code))
        accepted |= mapping.mask;
    } else if (wasSet) {
      tracker.recordRelease(mapping.code);
    }
  }
  previousModifiers = accepted;
}

void EventNormalizer::applyFocus(bool focus) {
  if (focus == tracker.hasFocus())
    return;

  SPDLOG_LOGGER_DEBUG(logger, "Focus {}", focus ? "gained" : "lost");
  if (!focus)
    releaseAll();
  tracker.setFocus(focus);
}

} // namespace tactile::input
