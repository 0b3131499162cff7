#include "aggregator.hpp"
#include "debug.hpp"
#include "log.hpp"

namespace tactile::input {

static auto logger = getLogger();

InputAggregator::InputAggregator(const AggregatorConfig &config, KeyMap keyMap)
    : config(config), tracker(config.initialFocus, config.deferSameTickRelease), normalizer(std::move(keyMap), tracker),
      queue(config.queueMode, config.queueCapacity) {
  SPDLOG_LOGGER_DEBUG(logger, "Created input aggregator, queue {} ({})", magic_enum::enum_name(config.queueMode),
                      config.queueCapacity);
}

bool InputAggregator::push(const RawEvent &event) { return queue.push(event); }

void InputAggregator::drainFrom(IRawEventSource &source) {
  drainedEvents.clear();
  source.drain(drainedEvents);
  for (auto &event : drainedEvents)
    apply(event);
  drainedEvents.clear();

  if (auto position = source.getPointerPosition())
    tracker.setPointer(*position);
}

void InputAggregator::notifyResized(bool destructive) {
  SPDLOG_LOGGER_DEBUG(logger, "Resize notification (destructive: {})", destructive);
  resizePending = true;
  if (destructive && config.releaseOnDestructiveResize)
    releaseAllPending = true;
  if (resizeHandler)
    resizeHandler(destructive);
}

std::shared_ptr<const Snapshot> InputAggregator::poll() {
  queue.drain([&](const RawEvent &event) { apply(event); });

  if (queue.consumeOverflow()) {
    SPDLOG_LOGGER_WARN(logger, "Input events were dropped, releasing all held codes");
    normalizer.releaseAll();
  }

  if (releaseAllPending.exchange(false)) {
    SPDLOG_LOGGER_DEBUG(logger, "Releasing all held codes after destructive resize");
    normalizer.releaseAll();
  }

  if (resizePending.exchange(false))
    tracker.markResized();

  lastSnapshot = publisher.publish(tracker);
  SPDLOG_LOGGER_TRACE(logger, "Published {}", debugFormat(*lastSnapshot));
  return lastSnapshot;
}

std::shared_ptr<const Snapshot> InputAggregator::poll(IRawEventSource &source) {
  drainFrom(source);
  return poll();
}

} // namespace tactile::input
