#include "publisher.hpp"
#include "log.hpp"

namespace tactile::input {

static auto logger = getLogger();

std::shared_ptr<const Snapshot> SnapshotPublisher::publish(PressTracker &tracker) {
  tracker.advanceTick();

  auto snapshot = std::make_shared<Snapshot>();
  snapshot->pointer = tracker.getPointer();
  snapshot->scroll = tracker.getScroll();
  snapshot->focus = tracker.hasFocus();
  snapshot->resized = tracker.wasResized();
  snapshot->tick = ++numPublished;

  auto &holds = tracker.getHolds();
  snapshot->down.reserve(holds.size());
  for (auto &[code, record] : holds)
    snapshot->down.emplace_hint(snapshot->down.end(), code, record.duration);

  size_t numPurged = tracker.purgeReleased();
  if (numPurged > 0)
    SPDLOG_LOGGER_TRACE(logger, "Tick {}: purged {} released codes", numPublished, numPurged);

  tracker.replayDeferredReleases();
  tracker.resetOneShots();

  return snapshot;
}

} // namespace tactile::input
