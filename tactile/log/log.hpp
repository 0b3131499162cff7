#ifndef F2B95C3E_08D4_4A71_B6E2_C41A7D93E85F
#define F2B95C3E_08D4_4A71_B6E2_C41A7D93E85F

#include <string>
#include <optional>
#include <spdlog/spdlog.h>
#include <shared_mutex>

namespace tactile::logging {
typedef std::shared_ptr<spdlog::logger> Logger;

// Reads a level from the given environment variable, trying the name as-is, lowercase and uppercase
std::optional<spdlog::level::level_enum> getLogLevelFromEnvVar(std::string name);

// Routes this logger into the shared sink
void initSinks(Logger logger);
// Applies LOG_<name>, then LOG, then the compile time default level
void initLogLevel(Logger logger);
// Applies LOG_<name>_FORMAT, then LOG_FORMAT, then the default pattern
void initLogFormat(Logger logger);

// Filter level of the shared sink, applies to every logger
spdlog::level::level_enum getSinkLevel();
void setSinkLevel(spdlog::level::level_enum level);

// Installs the default logger the first time this is called, an empty file name disables the log file
void setupDefaultLoggerConditional(std::string fileName = "tactile.log");

// !! Registers the logger, use getOrCreate instead
void __init(Logger logger);

std::shared_mutex &__getRegisterMutex();
template <typename T> Logger getOrCreate(const std::string &name, T init) {
  auto &m = __getRegisterMutex();
  std::shared_lock<std::shared_mutex> l(m);
  auto logger = spdlog::get(name);
  if (!logger) {
    l.unlock();
    std::unique_lock<std::shared_mutex> ul(m);

    // Another thread may have registered it in the meantime
    logger = spdlog::get(name);
    if (logger)
      return logger;

    logger = std::make_shared<spdlog::logger>(name);
    init(logger);
    __init(logger);
  }
  return logger;
}
inline Logger getOrCreate(const std::string &name) {
  return getOrCreate(name, [](Logger logger) {});
}
} // namespace tactile::logging

#endif /* F2B95C3E_08D4_4A71_B6E2_C41A7D93E85F */
