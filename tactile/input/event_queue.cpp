#include "event_queue.hpp"
#include "debug.hpp"
#include "log.hpp"
#include <stdexcept>

namespace tactile::input {

static auto logger = getLogger();

EventQueue::EventQueue(QueueMode mode, size_t capacity) : mode(mode), capacity(capacity) {
  if (capacity == 0)
    throw std::logic_error("Event queue capacity must be greater than zero");

  if (mode == QueueMode::Concurrent)
    ring = std::make_unique<boost::lockfree::spsc_queue<RawEvent>>(capacity);
  else
    confinedEvents.reserve(capacity);
}

bool EventQueue::push(const RawEvent &event) {
  bool pushed{};
  if (mode == QueueMode::Concurrent) {
    pushed = ring->push(event);
  } else {
    checkOwnerThread();
    if (confinedEvents.size() < capacity) {
      confinedEvents.push_back(event);
      pushed = true;
    }
  }

  if (!pushed && !overflowed.exchange(true)) {
    SPDLOG_LOGGER_WARN(logger, "Event queue full ({} events), dropping {}", capacity, debugFormat(event));
  }
  return pushed;
}

void EventQueue::checkOwnerThread() {
  auto current = std::this_thread::get_id();
  if (!ownerThread)
    ownerThread = current;
  else if (*ownerThread != current)
    throw std::logic_error("Thread confined event queue used from a different thread");
}

} // namespace tactile::input
