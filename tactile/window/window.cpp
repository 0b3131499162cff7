#include "window.hpp"
#include "log.hpp"
#include <core/error_utils.hpp>
#include <core/platform.hpp>
#include <input/sdl.hpp>
#include <stdexcept>

#if TC_WINDOWS
#include <Windows.h>
#endif

namespace tactile {

static auto logger = getWindowLogger();

void Window::init(const WindowCreationOptions &options, const input::AggregatorConfig &inputConfig) {
  if (window)
    throw std::logic_error("Already initialized");

#if TC_WINDOWS
  SetProcessDPIAware();
#endif

  if (!SDL_Init(SDL_INIT_EVENTS | SDL_INIT_VIDEO)) {
    throw formatException("SDL_Init failed: {}", SDL_GetError());
  }

  SDL_WindowFlags flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
  int width{options.width}, height{options.height};

#if TC_IOS || TC_ANDROID
  flags |= SDL_WINDOW_FULLSCREEN;
  width = 0;
  height = 0;
#endif

  SDL_SetHint(SDL_HINT_MOUSE_FOCUS_CLICKTHROUGH, "1");

  window = SDL_CreateWindow(options.title.c_str(), width, height, flags);
  if (!window) {
    std::string error = SDL_GetError();
    SDL_Quit();
    throw formatException("SDL_CreateWindow failed: {}", error);
  }

  if (options.fullscreen) {
    SDL_SetWindowFullscreen(window, true);
  }

  aggregator = std::make_unique<input::InputAggregator>(inputConfig, input::getSdlKeyMap());
  eventSource = std::make_unique<input::SdlEventSource>(window, aggregator.get());

  SPDLOG_LOGGER_INFO(logger, "Created window \"{}\" ({}x{})", options.title, width, height);
}

void Window::cleanup() {
  if (window) {
    // The event source refers to the aggregator
    eventSource.reset();
    aggregator.reset();

    SDL_DestroyWindow(window);
    SDL_Quit();
    window = nullptr;
  }
}

bool Window::isAlive() const { return window && !eventSource->isCloseRequested(); }

std::shared_ptr<const input::Snapshot> Window::poll() {
  if (!window)
    throw std::logic_error("Window not initialized");
  return aggregator->poll(*eventSource);
}

input::InputAggregator &Window::getInput() {
  if (!aggregator)
    throw std::logic_error("Window not initialized");
  return *aggregator;
}

int2 Window::getSize() const {
  int2 r;
  SDL_GetWindowSize(window, &r.x, &r.y);
  return r;
}

int2 Window::getDrawableSize() const {
  int2 r;
  SDL_GetWindowSizeInPixels(window, &r.x, &r.y);
  return r;
}

Window::~Window() { cleanup(); }
} // namespace tactile
