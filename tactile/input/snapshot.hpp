#ifndef D07B6E42_19A8_4C5F_8E31_F4A2C96B0D17
#define D07B6E42_19A8_4C5F_8E31_F4A2C96B0D17

#include "input.hpp"
#include <cstdint>
#include <optional>
#include <boost/container/flat_map.hpp>

namespace tactile::input {

// Input state as published once per tick, never modified after publishing
struct Snapshot {
  // Code -> ticks held, released codes hold (ticks held + ReleasedSentinel) for exactly one snapshot
  using DownMap = boost::container::flat_map<InputCode, int32_t>;

  int2 pointer{};
  // Accumulated since the previous snapshot
  float scroll{};
  bool focus{};
  // Resized or moved since the previous snapshot
  bool resized{};
  // Number of snapshots published so far, including this one
  uint64_t tick{};
  DownMap down;

  bool contains(InputCode code) const { return down.contains(code); }

  std::optional<int32_t> getDuration(InputCode code) const {
    auto it = down.find(code);
    if (it == down.end())
      return std::nullopt;
    return it->second;
  }

  bool isHeld(InputCode code) const {
    auto duration = getDuration(code);
    return duration && *duration >= 0;
  }

  bool isReleased(InputCode code) const {
    auto duration = getDuration(code);
    return duration && isReleasedDuration(*duration);
  }

  // First snapshot in which the code shows up as held
  bool justPressed(InputCode code) const {
    auto duration = getDuration(code);
    return duration && *duration == 0;
  }

  // Ticks held for held and released codes
  std::optional<int32_t> getHeldTicks(InputCode code) const {
    if (auto duration = getDuration(code))
      return heldTicks(*duration);
    return std::nullopt;
  }
};

} // namespace tactile::input

#endif /* D07B6E42_19A8_4C5F_8E31_F4A2C96B0D17 */
