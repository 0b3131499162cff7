#include "config.hpp"
#include "log.hpp"
#include <cstdint>
#include <cstdlib>
#include <string>
#include <magic_enum.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

namespace tactile::input {

static auto logger = getLogger();

static std::optional<bool> parseBool(std::string str) {
  boost::algorithm::trim(str);
  boost::algorithm::to_lower(str);
  if (str == "1" || str == "true" || str == "on" || str == "yes")
    return true;
  if (str == "0" || str == "false" || str == "off" || str == "no")
    return false;
  return std::nullopt;
}

static void readBool(const AggregatorConfig::EnvReader &getEnv, const char *name, bool &outValue) {
  if (const char *val = getEnv(name)) {
    if (auto parsed = parseBool(val))
      outValue = *parsed;
    else
      SPDLOG_LOGGER_WARN(logger, "Ignoring invalid value for {}: \"{}\"", name, val);
  }
}

AggregatorConfig AggregatorConfig::fromEnvironment() {
  return fromEnvironment([](const char *name) -> const char * { return std::getenv(name); });
}

AggregatorConfig AggregatorConfig::fromEnvironment(const EnvReader &getEnv) {
  AggregatorConfig config;

  if (const char *val = getEnv("TACTILE_INPUT_QUEUE_MODE")) {
    std::string str = boost::algorithm::trim_copy(std::string(val));
    if (auto mode = magic_enum::enum_cast<QueueMode>(str, magic_enum::case_insensitive))
      config.queueMode = *mode;
    else
      SPDLOG_LOGGER_WARN(logger, "Ignoring invalid value for TACTILE_INPUT_QUEUE_MODE: \"{}\"", val);
  }

  if (const char *val = getEnv("TACTILE_INPUT_QUEUE_CAPACITY")) {
    int64_t capacity{};
    if (boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(std::string(val)), capacity) && capacity > 0)
      config.queueCapacity = size_t(capacity);
    else
      SPDLOG_LOGGER_WARN(logger, "Ignoring invalid value for TACTILE_INPUT_QUEUE_CAPACITY: \"{}\"", val);
  }

  readBool(getEnv, "TACTILE_INPUT_INITIAL_FOCUS", config.initialFocus);
  readBool(getEnv, "TACTILE_INPUT_DEFER_SAME_TICK_RELEASE", config.deferSameTickRelease);
  readBool(getEnv, "TACTILE_INPUT_RELEASE_ON_DESTRUCTIVE_RESIZE", config.releaseOnDestructiveResize);

  SPDLOG_LOGGER_DEBUG(logger, "Aggregator config: queue {} ({}), initial focus: {}", magic_enum::enum_name(config.queueMode),
                      config.queueCapacity, config.initialFocus);
  return config;
}

} // namespace tactile::input
