#include "sdl_source.hpp"
#include "aggregator.hpp"
#include "log.hpp"
#include <cmath>

namespace tactile::input {

static auto logger = getLogger();

const KeyMap &getSdlKeyMap() {
  using IC = InputCode;
  static const KeyMap map = []() {
    KeyMap map;
    for (int i = 0; i < 26; i++)
      map.mapKey(SDL_SCANCODE_A + i, InputCode(uint16_t(IC::A) + i));
    // SDL orders the number row 1..9, 0
    for (int i = 0; i < 9; i++)
      map.mapKey(SDL_SCANCODE_1 + i, InputCode(uint16_t(IC::Digit1) + i));
    map.mapKey(SDL_SCANCODE_0, IC::Digit0);
    for (int i = 0; i < 12; i++)
      map.mapKey(SDL_SCANCODE_F1 + i, InputCode(uint16_t(IC::F1) + i));
    for (int i = 0; i < 8; i++)
      map.mapKey(SDL_SCANCODE_F13 + i, InputCode(uint16_t(IC::F13) + i));
    for (int i = 0; i < 9; i++)
      map.mapKey(SDL_SCANCODE_KP_1 + i, InputCode(uint16_t(IC::Keypad1) + i));

    map.mapKey(SDL_SCANCODE_KP_0, IC::Keypad0)
        .mapKey(SDL_SCANCODE_KP_PERIOD, IC::KeypadDecimal)
        .mapKey(SDL_SCANCODE_KP_MULTIPLY, IC::KeypadMultiply)
        .mapKey(SDL_SCANCODE_KP_PLUS, IC::KeypadPlus)
        .mapKey(SDL_SCANCODE_NUMLOCKCLEAR, IC::KeypadClear)
        .mapKey(SDL_SCANCODE_KP_DIVIDE, IC::KeypadDivide)
        .mapKey(SDL_SCANCODE_KP_ENTER, IC::KeypadEnter)
        .mapKey(SDL_SCANCODE_KP_MINUS, IC::KeypadMinus)
        .mapKey(SDL_SCANCODE_KP_EQUALS, IC::KeypadEquals)
        .mapKey(SDL_SCANCODE_EQUALS, IC::Equal)
        .mapKey(SDL_SCANCODE_MINUS, IC::Minus)
        .mapKey(SDL_SCANCODE_RIGHTBRACKET, IC::RightBracket)
        .mapKey(SDL_SCANCODE_LEFTBRACKET, IC::LeftBracket)
        .mapKey(SDL_SCANCODE_APOSTROPHE, IC::Quote)
        .mapKey(SDL_SCANCODE_SEMICOLON, IC::Semicolon)
        .mapKey(SDL_SCANCODE_BACKSLASH, IC::Backslash)
        .mapKey(SDL_SCANCODE_COMMA, IC::Comma)
        .mapKey(SDL_SCANCODE_SLASH, IC::Slash)
        .mapKey(SDL_SCANCODE_PERIOD, IC::Period)
        .mapKey(SDL_SCANCODE_GRAVE, IC::Grave)
        .mapKey(SDL_SCANCODE_RETURN, IC::Return)
        .mapKey(SDL_SCANCODE_TAB, IC::Tab)
        .mapKey(SDL_SCANCODE_SPACE, IC::Space)
        .mapKey(SDL_SCANCODE_BACKSPACE, IC::Backspace)
        .mapKey(SDL_SCANCODE_DELETE, IC::Delete)
        .mapKey(SDL_SCANCODE_ESCAPE, IC::Escape)
        .mapKey(SDL_SCANCODE_INSERT, IC::Insert)
        .mapKey(SDL_SCANCODE_CAPSLOCK, IC::CapsLock)
        .mapKey(SDL_SCANCODE_PRINTSCREEN, IC::PrintScreen)
        .mapKey(SDL_SCANCODE_PAUSE, IC::Pause)
        .mapKey(SDL_SCANCODE_HOME, IC::Home)
        .mapKey(SDL_SCANCODE_END, IC::End)
        .mapKey(SDL_SCANCODE_PAGEUP, IC::PageUp)
        .mapKey(SDL_SCANCODE_PAGEDOWN, IC::PageDown)
        .mapKey(SDL_SCANCODE_LEFT, IC::Left)
        .mapKey(SDL_SCANCODE_RIGHT, IC::Right)
        .mapKey(SDL_SCANCODE_UP, IC::Up)
        .mapKey(SDL_SCANCODE_DOWN, IC::Down)
        .mapKey(SDL_SCANCODE_HELP, IC::Help)
        .mapKey(SDL_SCANCODE_MENU, IC::Menu)
        .mapKey(SDL_SCANCODE_LCTRL, IC::Control)
        .mapKey(SDL_SCANCODE_RCTRL, IC::Control)
        .mapKey(SDL_SCANCODE_LSHIFT, IC::Shift)
        .mapKey(SDL_SCANCODE_RSHIFT, IC::Shift)
        .mapKey(SDL_SCANCODE_LALT, IC::Alt)
        .mapKey(SDL_SCANCODE_RALT, IC::Alt)
        .mapKey(SDL_SCANCODE_LGUI, IC::Command)
        .mapKey(SDL_SCANCODE_RGUI, IC::Command);

    map.mapButton(SDL_BUTTON_LEFT, IC::MouseLeft)
        .mapButton(SDL_BUTTON_MIDDLE, IC::MouseMiddle)
        .mapButton(SDL_BUTTON_RIGHT, IC::MouseRight);

    // SDL has no modifier bit for the function key
    map.mapModifier(SDL_KMOD_SHIFT, IC::Shift)
        .mapModifier(SDL_KMOD_CTRL, IC::Control)
        .mapModifier(SDL_KMOD_ALT, IC::Alt)
        .mapModifier(SDL_KMOD_GUI, IC::Command);
    return map;
  }();
  return map;
}

static int2 toPointer(float x, float y) { return int2(int(std::floor(x)), int(std::floor(y))); }

std::optional<RawEvent> translateSdlEvent(const SDL_Event &event, int2 windowSize) {
  switch (event.type) {
  case SDL_EVENT_KEY_DOWN:
    // Repeats would restart nothing, the key is already down
    if (event.key.repeat)
      return std::nullopt;
    return RawEvent{.kind = RawEventKind::KeyDown, .code = int32_t(event.key.scancode), .modifiers = uint32_t(event.key.mod)};
  case SDL_EVENT_KEY_UP:
    return RawEvent{.kind = RawEventKind::KeyUp, .code = int32_t(event.key.scancode), .modifiers = uint32_t(event.key.mod)};
  case SDL_EVENT_MOUSE_BUTTON_DOWN:
  case SDL_EVENT_MOUSE_BUTTON_UP:
    // Touches are reported separately
    if (event.button.which == SDL_TOUCH_MOUSEID)
      return std::nullopt;
    return RawEvent{
        .kind = event.type == SDL_EVENT_MOUSE_BUTTON_DOWN ? RawEventKind::MouseDown : RawEventKind::MouseUp,
        .code = int32_t(event.button.button),
        .modifiers = uint32_t(SDL_GetModState()),
        .pointer = toPointer(event.button.x, event.button.y),
    };
  case SDL_EVENT_MOUSE_MOTION:
    if (event.motion.which == SDL_TOUCH_MOUSEID)
      return std::nullopt;
    return RawEvent{.kind = RawEventKind::MouseMove, .pointer = toPointer(event.motion.x, event.motion.y)};
  case SDL_EVENT_MOUSE_WHEEL: {
    float delta = event.wheel.y;
    if (event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED)
      delta = -delta;
    return RawEvent{.kind = RawEventKind::Scroll, .scroll = delta};
  }
  case SDL_EVENT_FINGER_DOWN:
  case SDL_EVENT_FINGER_MOTION:
  case SDL_EVENT_FINGER_UP: {
    RawEventKind kind = event.type == SDL_EVENT_FINGER_DOWN   ? RawEventKind::TouchBegin
                        : event.type == SDL_EVENT_FINGER_UP ? RawEventKind::TouchEnd
                                                            : RawEventKind::TouchMove;
    return RawEvent{.kind = kind,
                    .pointer = toPointer(event.tfinger.x * float(windowSize.x), event.tfinger.y * float(windowSize.y))};
  }
  case SDL_EVENT_WINDOW_RESIZED:
  case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
    return RawEvent{.kind = RawEventKind::Resized};
  case SDL_EVENT_WINDOW_MOVED:
    return RawEvent{.kind = RawEventKind::Moved};
  case SDL_EVENT_WINDOW_MINIMIZED:
    return RawEvent{.kind = RawEventKind::Iconified};
  case SDL_EVENT_WINDOW_RESTORED:
    return RawEvent{.kind = RawEventKind::Uniconified};
  case SDL_EVENT_WINDOW_FOCUS_GAINED:
    return RawEvent{.kind = RawEventKind::FocusGained};
  case SDL_EVENT_WINDOW_FOCUS_LOST:
    return RawEvent{.kind = RawEventKind::FocusLost};
  case SDL_EVENT_QUIT:
  case SDL_EVENT_WINDOW_CLOSE_REQUESTED:
    return RawEvent{.kind = RawEventKind::CloseRequested};
  default:
    return std::nullopt;
  }
}

SdlEventSource::SdlEventSource(SDL_Window *window, InputAggregator *immediateTarget)
    : window(window), immediateTarget(immediateTarget) {
  if (immediateTarget) {
    if (!SDL_AddEventWatch(&SdlEventSource::eventWatch, this))
      SPDLOG_LOGGER_WARN(logger, "SDL_AddEventWatch failed, resizes are only seen on drain: {}", SDL_GetError());
  }
}

SdlEventSource::~SdlEventSource() {
  if (immediateTarget)
    SDL_RemoveEventWatch(&SdlEventSource::eventWatch, this);
}

bool SDLCALL SdlEventSource::eventWatch(void *userData, SDL_Event *event) {
  auto self = static_cast<SdlEventSource *>(userData);
  auto isOwnWindow = [&]() { return event->window.windowID == SDL_GetWindowID(self->window); };

  switch (event->type) {
  case SDL_EVENT_WINDOW_RESIZED:
  case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
  case SDL_EVENT_WINDOW_MOVED:
    if (isOwnWindow())
      self->immediateTarget->notifyResized(false);
    break;
  case SDL_EVENT_WINDOW_DISPLAY_CHANGED:
    // The drawable may be recreated for the new display
    if (isOwnWindow())
      self->immediateTarget->notifyResized(true);
    break;
  default:
    break;
  }
  return true;
}

void SdlEventSource::drain(std::vector<RawEvent> &outEvents) {
  int2 windowSize = getWindowSize();
  SDL_Event event{};
  while (SDL_PollEvent(&event)) {
    if (auto translated = translateSdlEvent(event, windowSize)) {
      if (translated->kind == RawEventKind::CloseRequested)
        closeRequested = true;
      outEvents.push_back(*translated);
    }
  }
}

std::optional<int2> SdlEventSource::getPointerPosition() const {
  float x{}, y{};
  SDL_GetMouseState(&x, &y);
  return toPointer(x, y);
}

int2 SdlEventSource::getWindowSize() const {
  int2 size{};
  if (!SDL_GetWindowSize(window, &size.x, &size.y))
    SPDLOG_LOGGER_WARN(logger, "SDL_GetWindowSize failed: {}", SDL_GetError());
  return size;
}

} // namespace tactile::input
