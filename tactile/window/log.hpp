#ifndef B0E63A9F_7D18_4C25_9F4A_E6C21B58D307
#define B0E63A9F_7D18_4C25_9F4A_E6C21B58D307

#include <log/log.hpp>

namespace tactile {
inline tactile::logging::Logger getWindowLogger() { return tactile::logging::getOrCreate("window"); }
} // namespace tactile

#endif /* B0E63A9F_7D18_4C25_9F4A_E6C21B58D307 */
