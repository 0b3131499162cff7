#include "tracker.hpp"
#include "log.hpp"
#include <algorithm>

namespace tactile::input {

static auto logger = getLogger();

void PressTracker::recordPress(InputCode code) {
  if (!focus)
    return;

  auto it = holds.find(code);
  if (it != holds.end() && it->second.duration >= 0) {
    // Pressed again before a deferred release was replayed, the key is still down
    auto deferred = std::find(deferredReleases.begin(), deferredReleases.end(), code);
    if (deferred != deferredReleases.end())
      deferredReleases.erase(deferred);
    return;
  }

  // Released entries are replaced, the code is down again
  holds.insert_or_assign(code, HoldRecord{.duration = 0, .fresh = true});
}

void PressTracker::recordRelease(InputCode code) {
  auto it = holds.find(code);
  if (it == holds.end())
    return;

  auto &record = it->second;
  if (record.duration < 0)
    return;

  if (record.fresh && deferSameTickRelease) {
    if (!hasDeferredRelease(code)) {
      SPDLOG_LOGGER_DEBUG(logger, "Deferring same tick release of {}", getInputCodeName(code));
      deferredReleases.push_back(code);
    }
    return;
  }

  record.duration += ReleasedSentinel;
}

void PressTracker::releaseAll() {
  deferredReleases.clear();
  for (auto &[code, record] : holds) {
    if (record.duration >= 0)
      record.duration += ReleasedSentinel;
  }
}

void PressTracker::advanceTick() {
  for (auto &[code, record] : holds) {
    if (record.duration >= 0 && !record.fresh && record.duration < MaxHeldTicks)
      ++record.duration;
  }
}

size_t PressTracker::purgeReleased() {
  size_t numRemoved{};
  for (auto it = holds.begin(); it != holds.end();) {
    if (it->second.duration < 0) {
      it = holds.erase(it);
      ++numRemoved;
    } else {
      ++it;
    }
  }
  return numRemoved;
}

void PressTracker::replayDeferredReleases() {
  for (auto &[code, record] : holds)
    record.fresh = false;

  for (auto code : deferredReleases) {
    SPDLOG_LOGGER_DEBUG(logger, "Replaying deferred release of {}", getInputCodeName(code));
    recordRelease(code);
  }
  deferredReleases.clear();
}

void PressTracker::resetOneShots() {
  scroll = 0.0f;
  resized = false;
}

bool PressTracker::isDown(InputCode code) const {
  auto it = holds.find(code);
  return it != holds.end() && it->second.duration >= 0;
}

bool PressTracker::hasDeferredRelease(InputCode code) const {
  return std::find(deferredReleases.begin(), deferredReleases.end(), code) != deferredReleases.end();
}

std::optional<int32_t> PressTracker::getDuration(InputCode code) const {
  auto it = holds.find(code);
  if (it == holds.end())
    return std::nullopt;
  return it->second.duration;
}

} // namespace tactile::input
