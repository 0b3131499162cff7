#ifndef F61C09A3_8D25_4E7B_B4F0_2A9E5D83C71B
#define F61C09A3_8D25_4E7B_B4F0_2A9E5D83C71B

#include "snapshot.hpp"
#include "tracker.hpp"
#include <memory>

namespace tactile::input {

struct SnapshotPublisher {
private:
  uint64_t numPublished{};

public:
  // Takes this tick's snapshot of the tracker and prepares the tracker for the next tick
  //   should be called once per tick, extra calls split the scroll and resize state between snapshots
  std::shared_ptr<const Snapshot> publish(PressTracker &tracker);

  uint64_t getNumPublished() const { return numPublished; }
};

} // namespace tactile::input

#endif /* F61C09A3_8D25_4E7B_B4F0_2A9E5D83C71B */
