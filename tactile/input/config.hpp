#ifndef E4B70C92_5A16_4D3E_8F29_71C0D3A6E85B
#define E4B70C92_5A16_4D3E_8F29_71C0D3A6E85B

#include "event_queue.hpp"
#include <cstddef>
#include <functional>

#ifndef TACTILE_INPUT_DEFAULT_QUEUE_CAPACITY
#define TACTILE_INPUT_DEFAULT_QUEUE_CAPACITY 1024
#endif

namespace tactile::input {

struct AggregatorConfig {
  static constexpr size_t DefaultQueueCapacity = TACTILE_INPUT_DEFAULT_QUEUE_CAPACITY;

  QueueMode queueMode = QueueMode::Confined;
  size_t queueCapacity = DefaultQueueCapacity;
  bool initialFocus = true;
  // Keep presses released within the same tick visible for one snapshot
  bool deferSameTickRelease = true;
  // Release every code when the window reports a destructive resize
  bool releaseOnDestructiveResize = true;

  using EnvReader = std::function<const char *(const char *)>;

  // Defaults overridden by TACTILE_INPUT_* environment variables, invalid values are ignored with a warning
  static AggregatorConfig fromEnvironment();
  static AggregatorConfig fromEnvironment(const EnvReader &getEnv);
};

} // namespace tactile::input

#endif /* E4B70C92_5A16_4D3E_8F29_71C0D3A6E85B */
