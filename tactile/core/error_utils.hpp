#ifndef TACTILE_ERROR_UTILS
#define TACTILE_ERROR_UTILS

#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace tactile {
template <typename... TArgs> std::runtime_error formatException(const char *format, TArgs... args) {
  return std::runtime_error(fmt::format(fmt::runtime(format), args...));
}
} // namespace tactile

#endif // TACTILE_ERROR_UTILS
