#include "log.hpp"
#include <cstdlib>
#include <mutex>
#include <spdlog/spdlog.h>
#include <magic_enum.hpp>
#include <boost/filesystem.hpp>
#include <boost/algorithm/string.hpp>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "../core/platform.hpp"
#if TC_ANDROID
#include <spdlog/sinks/android_sink.h>
#endif

namespace tactile::logging {

std::shared_mutex &__getRegisterMutex() {
  static std::shared_mutex m;
  return m;
}

static const char *readEnvVar(std::string name) {
  if (const char *val = std::getenv(name.c_str()))
    return val;
  boost::algorithm::to_lower(name);
  if (const char *val = std::getenv(name.c_str()))
    return val;
  boost::algorithm::to_upper(name);
  return std::getenv(name.c_str());
}

std::optional<spdlog::level::level_enum> getLogLevelFromEnvVar(std::string name) {
  if (const char *val = readEnvVar(name)) {
    std::string str = val;
    boost::algorithm::trim(str);
    if (auto level = magic_enum::enum_cast<spdlog::level::level_enum>(str, magic_enum::case_insensitive))
      return level;
    // Long names as printed by spdlog
    if (boost::algorithm::iequals(str, "warning"))
      return spdlog::level::warn;
    if (boost::algorithm::iequals(str, "error"))
      return spdlog::level::err;
  }
  return std::nullopt;
}

struct Config {
  static constexpr std::optional<spdlog::level::level_enum> DefaultStdErrLogLevel =
#ifdef TACTILE_DEFAULT_STDOUT_LOG_LEVEL
      spdlog::level::level_enum(TACTILE_DEFAULT_STDOUT_LOG_LEVEL);
#else
      std::nullopt;
#endif

  static constexpr std::optional<spdlog::level::level_enum> DefaultFileLogLevel =
#ifdef TACTILE_DEFAULT_FILE_LOG_LEVEL
      spdlog::level::level_enum(TACTILE_DEFAULT_FILE_LOG_LEVEL);
#else
      std::nullopt;
#endif

  static constexpr std::optional<spdlog::level::level_enum> DefaultLoggerLevel =
#ifdef TACTILE_DEFAULT_LOG_LEVEL
      spdlog::level::level_enum(TACTILE_DEFAULT_LOG_LEVEL);
#else
      std::nullopt;
#endif

  static constexpr std::optional<spdlog::level::level_enum> getDefaultLogLevel() {
    if (DefaultLoggerLevel)
      return *DefaultLoggerLevel;

    if (!DefaultStdErrLogLevel && !DefaultFileLogLevel)
      return std::nullopt;

    // Loggers need to pass through the most verbose sink
    spdlog::level::level_enum level = spdlog::level::info;
    if (DefaultStdErrLogLevel)
      level = std::min(level, *DefaultStdErrLogLevel);
    if (DefaultFileLogLevel)
      level = std::min(level, *DefaultFileLogLevel);
    return level;
  }
};

struct Sinks {
  std::shared_mutex lock;

  std::shared_ptr<spdlog::sinks::dist_sink_mt> distSink;
  std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> stdErrSink;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> logFileSink;
#if TC_ANDROID
  std::shared_ptr<spdlog::sinks::android_sink_mt> androidSink;
#endif

  bool logLevelOverriden{};

  Sinks() {
    distSink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    initStdErrSink();

#if TC_ANDROID
    androidSink = std::make_shared<spdlog::sinks::android_sink_mt>("tactile");
    distSink->add_sink(androidSink);
#endif

    if (Config::DefaultStdErrLogLevel) {
      stdErrSink->set_level(Config::DefaultStdErrLogLevel.value());
    }
    if (auto filter = getLogLevelFromEnvVar("LOG_STDERR_FILTER")) {
      stdErrSink->set_level(*filter);
      logLevelOverriden = true;
    }
  }

  std::unique_lock<std::shared_mutex> lockUnique() { return std::unique_lock<std::shared_mutex>(lock); }

  void initStdErrSink() {
    if (stdErrSink)
      distSink->remove_sink(stdErrSink);
    stdErrSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    distSink->add_sink(stdErrSink);
  }

  void initLogFile(const std::string &fileName) {
    std::string logFilePath = boost::filesystem::absolute(fileName).string();
    if (logFileSink)
      distSink->remove_sink(logFileSink);

    logFileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFilePath, true);
    if (Config::DefaultFileLogLevel) {
      logFileSink->set_level(Config::DefaultFileLogLevel.value());
    }
    distSink->add_sink(logFileSink);
  }

  // Environment overrides take precedence over compile time sink filters
  void overrideLogLevel() {
    if (!logLevelOverriden) {
      for (auto &s : distSink->sinks())
        s->set_level(spdlog::level::trace);
      logLevelOverriden = true;
    }
  }
};

static Sinks &globalSinks() {
  static Sinks sinks;
  return sinks;
}

void __init(Logger logger) {
  spdlog::register_logger(logger);
  logger->flush_on(spdlog::level::err);
  initLogLevel(logger);
  initLogFormat(logger);
  initSinks(logger);
}

void initLogLevel(Logger logger) {
  if (auto level = getLogLevelFromEnvVar(fmt::format("LOG_{}", logger->name()))) {
    globalSinks().overrideLogLevel();
    logger->set_level(level.value());
    return;
  }

  if (auto globalLevel = getLogLevelFromEnvVar("LOG")) {
    globalSinks().overrideLogLevel();
    logger->set_level(globalLevel.value());
    return;
  }

  if (auto ll = Config::getDefaultLogLevel()) {
    logger->set_level(ll.value());
  }
}

void initLogFormat(Logger logger) {
  if (const char *val = readEnvVar(fmt::format("LOG_{}_FORMAT", logger->name()))) {
    logger->set_pattern(val);
  } else if (const char *val = readEnvVar("LOG_FORMAT")) {
    logger->set_pattern(val);
  } else {
#if TC_ANDROID
    // Logcat adds its own timestamp and level
    logger->set_pattern("[T-%t][%n][%s::%#] %v");
#else
    logger->set_pattern("[%d/%m %T.%e][T-%t][%n]%^[%l]%$[%s::%#] %v");
#endif
  }
}

void initSinks(Logger logger) {
  logger->sinks().clear();
  logger->sinks().push_back(globalSinks().distSink);
}

spdlog::level::level_enum getSinkLevel() { return globalSinks().distSink->level(); }

void setSinkLevel(spdlog::level::level_enum level) { globalSinks().distSink->set_level(level); }

static void setupDefaultLogger(const std::string &fileName) {
  auto &sinks = globalSinks();

  {
    auto l = sinks.lockUnique();
    if (!fileName.empty()) {
      sinks.initLogFile(fileName);
    }
    // The stderr handle may have been replaced since the sinks were created
    sinks.initStdErrSink();
  }

  auto logger = std::make_shared<spdlog::logger>("tactile", sinks.distSink);
  logger->flush_on(spdlog::level::err);
  spdlog::set_default_logger(logger);
  initLogLevel(logger);
  initLogFormat(logger);

  setSinkLevel(spdlog::level::trace);

  spdlog::apply_all([&](Logger logger) { initSinks(logger); });
}

void setupDefaultLoggerConditional(std::string fileName) {
  static std::once_flag once;
  std::call_once(once, [&]() { setupDefaultLogger(fileName); });
}
} // namespace tactile::logging
