#ifndef E94A1D27_6C3B_4F08_A5E2_0B7F3C19D864
#define E94A1D27_6C3B_4F08_A5E2_0B7F3C19D864

#include "input.hpp"
#include <boost/container/flat_map.hpp>
#include <boost/container/small_vector.hpp>

namespace tactile::input {

// Durations stop advancing here so a held value can never reach the released range
inline constexpr int32_t MaxHeldTicks = -ReleasedSentinel - 1;

struct HoldRecord {
  // Ticks held, or ticks held + ReleasedSentinel once released
  int32_t duration{};
  // Pressed since the last publish, not yet seen by the consumer
  bool fresh{};
};

// Live press state, mutated by normalized events and once per tick by the publisher
//   Up -> Down(0) -> Down(n) -> Released(n + ReleasedSentinel) -> Up
struct PressTracker {
  using HoldMap = boost::container::flat_map<InputCode, HoldRecord>;

private:
  HoldMap holds;
  // Releases of codes pressed in the tick that is still being collected
  boost::container::small_vector<InputCode, 8> deferredReleases;

  int2 pointer{};
  float scroll{};
  bool focus{true};
  bool resized{};
  bool deferSameTickRelease{true};

public:
  PressTracker() = default;
  PressTracker(bool initialFocus, bool deferSameTickRelease)
      : focus(initialFocus), deferSameTickRelease(deferSameTickRelease) {}

  // Inserts Down(0), ignored while unfocused or when the code is already down
  void recordPress(InputCode code);
  // Marks a down code as released, keeping its held duration recoverable
  //   a release for a code pressed during the current tick is deferred until after the next publish
  void recordRelease(InputCode code);
  // Releases every down code immediately, deferred releases included
  void releaseAll();
  // Advances every down code that the consumer has already seen by one tick
  void advanceTick();

  // Drops every released entry, returns the number of entries removed
  size_t purgeReleased();
  // Marks all presses as seen by the consumer and applies the deferred releases
  void replayDeferredReleases();
  // Clears scroll and resized
  void resetOneShots();

  void setFocus(bool focus) { this->focus = focus; }
  void setPointer(int2 pointer) { this->pointer = pointer; }
  void addScroll(float delta) { scroll += delta; }
  void markResized() { resized = true; }

  bool isDown(InputCode code) const;
  bool hasDeferredRelease(InputCode code) const;
  std::optional<int32_t> getDuration(InputCode code) const;

  const HoldMap &getHolds() const { return holds; }
  HoldMap &getHolds() { return holds; }
  int2 getPointer() const { return pointer; }
  float getScroll() const { return scroll; }
  bool hasFocus() const { return focus; }
  bool wasResized() const { return resized; }
};

} // namespace tactile::input

#endif /* E94A1D27_6C3B_4F08_A5E2_0B7F3C19D864 */
