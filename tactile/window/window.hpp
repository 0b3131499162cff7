#ifndef A64D2C18_F3B9_4E70_8A15_C97E0D4B2F63
#define A64D2C18_F3B9_4E70_8A15_C97E0D4B2F63

#include <input/aggregator.hpp>
#include <input/sdl_source.hpp>
#include <linalg.h>
#include <memory>
#include <string>

struct SDL_Window;
namespace tactile {
using namespace linalg::aliases;

struct WindowCreationOptions {
  int width = 1280;
  int height = 720;
  bool fullscreen = false;
  std::string title = "tactile";
};

// An SDL window together with the input aggregator fed by its events
struct Window {
  SDL_Window *window = nullptr;

private:
  std::unique_ptr<input::InputAggregator> aggregator;
  std::unique_ptr<input::SdlEventSource> eventSource;

public:
  Window() = default;
  Window(const Window &) = delete;
  Window &operator=(const Window &) = delete;
  ~Window();

  // Throws when SDL or the window can not be initialized
  void init(const WindowCreationOptions &options = WindowCreationOptions{},
            const input::AggregatorConfig &inputConfig = input::AggregatorConfig::fromEnvironment());
  void cleanup();

  bool isInitialized() const { return window != nullptr; }

  // False once the user or the OS asked the window to close
  bool isAlive() const;

  // Drains the SDL event queue and publishes this tick's input snapshot
  //   call once per tick from the thread that created the window
  std::shared_ptr<const input::Snapshot> poll();

  input::InputAggregator &getInput();

  // window size
  int2 getSize() const;
  // draw surface size
  int2 getDrawableSize() const;
};
} // namespace tactile

#endif /* A64D2C18_F3B9_4E70_8A15_C97E0D4B2F63 */
