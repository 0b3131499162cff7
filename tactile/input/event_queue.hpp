#ifndef A95E2B70_3C1D_4F86_B7A4_E08D6F1C2953
#define A95E2B70_3C1D_4F86_B7A4_E08D6F1C2953

#include "events.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <thread>
#include <vector>
#include <boost/lockfree/spsc_queue.hpp>

namespace tactile::input {

enum class QueueMode : uint8_t {
  // Producer and consumer share one thread, no synchronization
  Confined,
  // One producer thread and one consumer thread, lock-free ring
  Concurrent,
};

// Bounded buffer between an event producer and the once per tick drain
//   when full the newest events are dropped and the overflow flag is raised
struct EventQueue {
private:
  QueueMode mode;
  size_t capacity;

  std::vector<RawEvent> confinedEvents;
  std::optional<std::thread::id> ownerThread;

  std::unique_ptr<boost::lockfree::spsc_queue<RawEvent>> ring;

  std::atomic<bool> overflowed{};

public:
  EventQueue(QueueMode mode, size_t capacity);

  // Returns false when the event was dropped
  //   throws std::logic_error when a confined queue is used from a second thread
  bool push(const RawEvent &event);

  template <typename T> size_t drain(T &&callback) {
    if (mode == QueueMode::Concurrent)
      return ring->consume_all(callback);

    checkOwnerThread();
    size_t numEvents = confinedEvents.size();
    for (auto &event : confinedEvents)
      callback(event);
    confinedEvents.clear();
    return numEvents;
  }

  // Returns true once for every overflow since the previous call
  bool consumeOverflow() { return overflowed.exchange(false); }

private:
  void checkOwnerThread();
};

} // namespace tactile::input

#endif /* A95E2B70_3C1D_4F86_B7A4_E08D6F1C2953 */
