#include <window/window.hpp>
#include <input/debug.hpp>
#include <log/log.hpp>
#include <input/sdl.hpp>
#include <spdlog/spdlog.h>
#include <boost/lexical_cast.hpp>
#include <stdlib.h>
#include <string.h>
#include <string>

struct Options {
  tactile::WindowCreationOptions window{.title = "tactile probe"};
  // 0 runs until the window is closed
  uint64_t maxTicks{};
  std::string logFile;
};

static bool hasChanged(const tactile::input::Snapshot &snapshot, const tactile::input::Snapshot *previous) {
  if (!previous)
    return true;
  return snapshot.down != previous->down || snapshot.scroll != 0.0f || snapshot.resized || snapshot.focus != previous->focus;
}

static int runProbe(const Options &options) {
  tactile::logging::setupDefaultLoggerConditional(options.logFile);

  tactile::Window window;
  window.init(options.window);

  std::shared_ptr<const tactile::input::Snapshot> previous;
  while (window.isAlive()) {
    auto snapshot = window.poll();
    if (hasChanged(*snapshot, previous.get()))
      spdlog::info("{}", tactile::input::debugFormat(*snapshot));
    previous = snapshot;

    if (options.maxTicks > 0 && snapshot->tick >= options.maxTicks)
      break;
    SDL_Delay(16);
  }

  window.cleanup();
  return 0;
}

int main(int argc, char **argv) {
  Options options;

  int argIndex = 1;
  while (argIndex < argc) {
    auto readValue = [&](const char *name, auto &outValue) {
      if (strcmp(argv[argIndex], name) != 0)
        return false;
      if (++argIndex >= argc) {
        spdlog::error("Missing value for {}", name);
        exit(1);
      }
      if (!boost::conversion::try_lexical_convert(argv[argIndex], outValue)) {
        spdlog::error("Invalid value for {}: '{}'", name, argv[argIndex]);
        exit(1);
      }
      ++argIndex;
      return true;
    };

    if (strcmp(argv[argIndex], "-fullscreen") == 0) {
      options.window.fullscreen = true;
      ++argIndex;
    } else if (!readValue("-title", options.window.title) && !readValue("-width", options.window.width) &&
               !readValue("-height", options.window.height) && !readValue("-ticks", options.maxTicks) &&
               !readValue("-log", options.logFile)) {
      spdlog::error("Unknown argument: '{}'", argv[argIndex]);
      spdlog::warn("Syntax: {} [-title <title>] [-width <w>] [-height <h>] [-fullscreen] [-ticks <n>] [-log <file>]", argv[0]);
      return 1;
    }
  }

  try {
    return runProbe(options);
  } catch (const std::exception &e) {
    spdlog::error("Probe failed: {}", e.what());
    return 1;
  }
}
