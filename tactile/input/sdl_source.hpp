#ifndef F83B16D2_4E95_4A07_9C1E_3D72B0A5E648
#define F83B16D2_4E95_4A07_9C1E_3D72B0A5E648

#include "source.hpp"
#include "sdl.hpp"

namespace tactile::input {
struct InputAggregator;

// SDL scancodes, SDL mouse button indices and SDL_Keymod bits
const KeyMap &getSdlKeyMap();

// Converts one SDL event, returns std::nullopt for events without an input meaning
//   touch coordinates are scaled by windowSize
std::optional<RawEvent> translateSdlEvent(const SDL_Event &event, int2 windowSize);

// Raw events from the SDL event queue of one window
//   SDL_PollEvent has to be called on the thread that initialized the video subsystem
struct SdlEventSource : public IRawEventSource {
private:
  SDL_Window *window{};
  InputAggregator *immediateTarget{};
  bool closeRequested{};

public:
  // immediateTarget receives resize and move notifications as soon as SDL reports them
  SdlEventSource(SDL_Window *window, InputAggregator *immediateTarget = nullptr);
  ~SdlEventSource();
  SdlEventSource(const SdlEventSource &) = delete;
  SdlEventSource &operator=(const SdlEventSource &) = delete;

  void drain(std::vector<RawEvent> &outEvents) override;
  std::optional<int2> getPointerPosition() const override;
  const KeyMap &getKeyMap() const override { return getSdlKeyMap(); }
  bool isCloseRequested() const override { return closeRequested; }

private:
  static bool SDLCALL eventWatch(void *userData, SDL_Event *event);
  int2 getWindowSize() const;
};
} // namespace tactile::input

#endif /* F83B16D2_4E95_4A07_9C1E_3D72B0A5E648 */
