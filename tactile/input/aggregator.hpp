#ifndef C1F94A28_B6E3_4D71_8502_9E7A3D0C6B84
#define C1F94A28_B6E3_4D71_8502_9E7A3D0C6B84

#include "config.hpp"
#include "event_queue.hpp"
#include "normalizer.hpp"
#include "publisher.hpp"
#include "source.hpp"
#include "tracker.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <vector>

namespace tactile::input {

// Called synchronously from notifyResized, on the notifying thread
using ResizeHandler = std::function<void(bool destructive)>;

// Collects raw events for one window and publishes one snapshot per tick
//   owned by the window it belongs to, several aggregators can exist side by side
struct InputAggregator {
private:
  AggregatorConfig config;
  PressTracker tracker;
  EventNormalizer normalizer;
  SnapshotPublisher publisher;
  EventQueue queue;

  std::vector<RawEvent> drainedEvents;
  std::shared_ptr<const Snapshot> lastSnapshot;

  std::atomic<bool> resizePending{};
  std::atomic<bool> releaseAllPending{};
  ResizeHandler resizeHandler;

public:
  InputAggregator(const AggregatorConfig &config, KeyMap keyMap);
  InputAggregator(const InputAggregator &) = delete;
  InputAggregator &operator=(const InputAggregator &) = delete;

  // Producer side, queues an event for the next poll
  //   returns false when the queue is full and the event was dropped
  bool push(const RawEvent &event);

  // Pull model, applies every pending event of the source right away
  //   call from the consumer thread
  void drainFrom(IRawEventSource &source);

  // Immediate resize/move notification, safe to call from any thread
  void notifyResized(bool destructive);

  // Set before any producer starts calling notifyResized
  void setResizeHandler(ResizeHandler handler) { resizeHandler = std::move(handler); }

  // Applies queued events and publishes this tick's snapshot, call once per tick
  std::shared_ptr<const Snapshot> poll();
  // Drains the source first, then polls
  std::shared_ptr<const Snapshot> poll(IRawEventSource &source);

  const std::shared_ptr<const Snapshot> &getLastSnapshot() const { return lastSnapshot; }
  const KeyMap &getKeyMap() const { return normalizer.getKeyMap(); }

private:
  void apply(const RawEvent &event) { normalizer.apply(event); }
};

} // namespace tactile::input

#endif /* C1F94A28_B6E3_4D71_8502_9E7A3D0C6B84 */
