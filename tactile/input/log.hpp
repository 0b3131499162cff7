#ifndef A3F18C5D_E762_4B09_9D4E_52C0B7A1F936
#define A3F18C5D_E762_4B09_9D4E_52C0B7A1F936

#include <log/log.hpp>

namespace tactile::input {
inline tactile::logging::Logger getLogger() {
  return tactile::logging::getOrCreate("input", [](tactile::logging::Logger logger) {
    logger->set_level(spdlog::level::info);
  });
}
} // namespace tactile::input

#endif /* A3F18C5D_E762_4B09_9D4E_52C0B7A1F936 */
