#define CATCH_CONFIG_RUNNER
#include <catch2/catch_all.hpp>
#include <spdlog/spdlog.h>
#include <input/aggregator.hpp>
#include <input/config.hpp>
#include <input/debug.hpp>
#include <input/event_queue.hpp>
#include <input/key_map.hpp>
#include <input/log.hpp>
#include <input/normalizer.hpp>
#include <input/publisher.hpp>
#include <input/tracker.hpp>
#include <linalg.h>
#include <stdint.h>
#include <atomic>
#include <chrono>
#include <future>
#include <map>
#include <string>
#include <thread>

using namespace linalg::aliases;
using namespace tactile::input;

// Native codes of the win32 table
static constexpr int32_t VK_A = 0x41;
static constexpr int32_t VK_B = 0x42;
static constexpr int32_t VK_SHIFT = 0x10;
static constexpr int32_t VK_LWIN = 0x5B;
static constexpr int32_t VK_RWIN = 0x5C;
static constexpr int32_t VK_LBUTTON = 0x01;
static constexpr uint32_t ShiftMask = 1u << 17;
static constexpr uint32_t ControlMask = 1u << 18;
static constexpr uint32_t CommandMask = 1u << 19;

static RawEvent keyDown(int32_t code, std::optional<uint32_t> modifiers = std::nullopt) {
  return RawEvent{.kind = RawEventKind::KeyDown, .code = code, .modifiers = modifiers};
}

static RawEvent keyUp(int32_t code, std::optional<uint32_t> modifiers = std::nullopt) {
  return RawEvent{.kind = RawEventKind::KeyUp, .code = code, .modifiers = modifiers};
}

static RawEvent windowEvent(RawEventKind kind) { return RawEvent{.kind = kind}; }

TEST_CASE("Input codes") {
  SECTION("Categories") {
    CHECK(getInputCodeCategory(InputCode::Digit0) == InputCategory::Digit);
    CHECK(getInputCodeCategory(InputCode::Digit9) == InputCategory::Digit);
    CHECK(getInputCodeCategory(InputCode::A) == InputCategory::Letter);
    CHECK(getInputCodeCategory(InputCode::Z) == InputCategory::Letter);
    CHECK(getInputCodeCategory(InputCode::F20) == InputCategory::FunctionKey);
    CHECK(getInputCodeCategory(InputCode::KeypadEquals) == InputCategory::Keypad);
    CHECK(getInputCodeCategory(InputCode::Pause) == InputCategory::Editing);
    CHECK(getInputCodeCategory(InputCode::Menu) == InputCategory::Navigation);
    CHECK(getInputCodeCategory(InputCode::Alt) == InputCategory::Modifier);
    CHECK(getInputCodeCategory(InputCode::Touch) == InputCategory::Pointer);
    CHECK(isModifier(InputCode::Shift));
    CHECK_FALSE(isModifier(InputCode::S));
  }

  SECTION("Names") {
    CHECK(getInputCodeName(InputCode::A) == "A");
    CHECK(getInputCodeName(InputCode::MouseLeft) == "MouseLeft");
    CHECK(getInputCodeName(InputCode(0x01)) == "Unknown");
    CHECK(parseInputCode("keypadenter") == InputCode::KeypadEnter);
    CHECK(parseInputCode("Shift") == InputCode::Shift);
    CHECK_FALSE(parseInputCode("NotAKey"));
  }

  SECTION("Every code has a unique name that parses back") {
    for (auto code : magic_enum::enum_values<InputCode>()) {
      auto name = getInputCodeName(code);
      CHECK(name != "Unknown");
      CHECK(parseInputCode(name) == code);
    }
  }

  SECTION("Released durations") {
    CHECK(heldTicks(0) == 0);
    CHECK(heldTicks(42) == 42);
    CHECK(heldTicks(42 + ReleasedSentinel) == 42);
    CHECK(isReleasedDuration(ReleasedSentinel));
    CHECK(isReleasedDuration(MaxHeldTicks + ReleasedSentinel));
    CHECK_FALSE(isReleasedDuration(MaxHeldTicks));
  }
}

TEST_CASE("Key maps") {
  SECTION("Win32") {
    auto &map = KeyMap::win32();
    CHECK(map.translateKey(VK_A) == InputCode::A);
    CHECK(map.translateKey(0x30) == InputCode::Digit0);
    CHECK(map.translateKey(0x70) == InputCode::F1);
    CHECK(map.translateKey(0x69) == InputCode::Keypad9);
    CHECK(map.translateKey(0x25) == InputCode::Left);
    CHECK(map.translateKey(VK_SHIFT) == InputCode::Shift);
    CHECK(map.translateButton(0x01) == InputCode::MouseLeft);
    CHECK(map.translateButton(0x02) == InputCode::MouseRight);
    CHECK(map.translateButton(0x04) == InputCode::MouseMiddle);
    CHECK_FALSE(map.translateKey(0xFF));
    CHECK(map.modifiers.size() == 5);
  }

  SECTION("Darwin") {
    auto &map = KeyMap::darwin();
    CHECK(map.translateKey(0x00) == InputCode::A);
    CHECK(map.translateKey(0x1D) == InputCode::Digit0);
    CHECK(map.translateKey(0x7A) == InputCode::F1);
    CHECK(map.translateKey(0x7E) == InputCode::Up);
    CHECK(map.translateButton(0) == InputCode::MouseLeft);
    CHECK(map.translateButton(2) == InputCode::MouseMiddle);
  }

  SECTION("Each native table maps into distinct codes") {
    for (auto *map : {&KeyMap::win32(), &KeyMap::darwin()}) {
      for (auto &[native, code] : map->keys) {
        CHECK(getInputCodeCategory(code) != InputCategory::Pointer);
        CHECK(getInputCodeName(code) != "Unknown");
      }
      for (auto &[native, code] : map->buttons)
        CHECK(getInputCodeCategory(code) == InputCategory::Pointer);
      for (auto &mapping : map->modifiers)
        CHECK(isModifier(mapping.code));
    }
  }

  SECTION("Runtime mappings") {
    KeyMap map;
    map.mapKey(7, InputCode::Q).mapButton(1, InputCode::MouseLeft).mapModifier(0x1, InputCode::Shift);
    CHECK(map.translateKey(7) == InputCode::Q);
    map.mapKey(7, InputCode::W);
    CHECK(map.translateKey(7) == InputCode::W);
    map.mapModifier(0x6, InputCode::Shift);
    REQUIRE(map.modifiers.size() == 1);
    CHECK(map.modifiers[0].mask == 0x6);
  }
}

TEST_CASE("Press tracker") {
  PressTracker tracker;
  SnapshotPublisher publisher;

  SECTION("Repeated presses keep the duration") {
    tracker.recordPress(InputCode::A);
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == 0);
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == 1);
    tracker.recordPress(InputCode::A);
    tracker.recordPress(InputCode::A);
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == 2);
  }

  SECTION("Release of an absent code is ignored") {
    tracker.recordRelease(InputCode::B);
    CHECK(tracker.getHolds().empty());
    CHECK(publisher.publish(tracker)->down.empty());
  }

  SECTION("Double release keeps the held duration") {
    tracker.recordPress(InputCode::A);
    publisher.publish(tracker);
    publisher.publish(tracker);
    tracker.recordRelease(InputCode::A);
    tracker.recordRelease(InputCode::A);
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->getHeldTicks(InputCode::A) == 1);
  }

  SECTION("Presses are ignored without focus") {
    tracker.setFocus(false);
    tracker.recordPress(InputCode::A);
    CHECK_FALSE(tracker.isDown(InputCode::A));
    CHECK(publisher.publish(tracker)->down.empty());
  }

  SECTION("Press after release in the same tick") {
    tracker.recordPress(InputCode::A);
    publisher.publish(tracker);
    tracker.recordRelease(InputCode::A);
    tracker.recordPress(InputCode::A);
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->justPressed(InputCode::A));
  }

  SECTION("Press cancels a deferred release") {
    tracker.recordPress(InputCode::A);
    tracker.recordRelease(InputCode::A);
    CHECK(tracker.hasDeferredRelease(InputCode::A));
    tracker.recordPress(InputCode::A);
    CHECK_FALSE(tracker.hasDeferredRelease(InputCode::A));
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == 0);
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == 1);
  }

  SECTION("Durations advance once the press was published") {
    tracker.recordPress(InputCode::A);
    tracker.advanceTick();
    CHECK(tracker.getDuration(InputCode::A) == 0);
    publisher.publish(tracker);
    for (int i = 0; i < 3; i++)
      tracker.advanceTick();
    CHECK(tracker.getDuration(InputCode::A) == 3);
  }

  SECTION("Durations saturate below the released range") {
    tracker.recordPress(InputCode::A);
    publisher.publish(tracker);
    tracker.getHolds()[InputCode::A].duration = MaxHeldTicks - 1;
    CHECK(publisher.publish(tracker)->getDuration(InputCode::A) == MaxHeldTicks);
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->getDuration(InputCode::A) == MaxHeldTicks);
    CHECK(snapshot->isHeld(InputCode::A));

    tracker.recordRelease(InputCode::A);
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->getHeldTicks(InputCode::A) == MaxHeldTicks);
  }
}

TEST_CASE("Snapshot publishing") {
  PressTracker tracker;
  SnapshotPublisher publisher;

  SECTION("Hold and release") {
    tracker.recordPress(InputCode::A);
    for (int32_t expected = 0; expected <= 3; expected++) {
      auto snapshot = publisher.publish(tracker);
      CHECK(snapshot->isHeld(InputCode::A));
      CHECK(snapshot->getDuration(InputCode::A) == expected);
    }

    tracker.recordRelease(InputCode::A);
    auto released = publisher.publish(tracker);
    CHECK_FALSE(released->isHeld(InputCode::A));
    CHECK(released->isReleased(InputCode::A));
    CHECK(released->getDuration(InputCode::A) == 3 + ReleasedSentinel);
    CHECK(released->getHeldTicks(InputCode::A) == 3);

    for (int i = 0; i < 3; i++)
      CHECK_FALSE(publisher.publish(tracker)->contains(InputCode::A));
  }

  SECTION("Press and release within one tick stay visible") {
    tracker.recordPress(InputCode::A);
    tracker.recordRelease(InputCode::A);

    auto first = publisher.publish(tracker);
    CHECK(first->isHeld(InputCode::A));
    CHECK(first->getDuration(InputCode::A) == 0);

    auto second = publisher.publish(tracker);
    CHECK_FALSE(second->isHeld(InputCode::A));
    CHECK(second->getHeldTicks(InputCode::A) == 0);

    for (int i = 0; i < 3; i++)
      CHECK_FALSE(publisher.publish(tracker)->contains(InputCode::A));
  }

  SECTION("Same tick release without deferral") {
    PressTracker immediate(true, false);
    immediate.recordPress(InputCode::A);
    immediate.recordRelease(InputCode::A);
    auto snapshot = publisher.publish(immediate);
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK_FALSE(publisher.publish(immediate)->contains(InputCode::A));
  }

  SECTION("Release all") {
    tracker.recordPress(InputCode::A);
    tracker.recordPress(InputCode::B);
    tracker.recordPress(InputCode::MouseLeft);
    publisher.publish(tracker);
    tracker.recordPress(InputCode::C);
    tracker.recordRelease(InputCode::C);

    tracker.releaseAll();
    auto snapshot = publisher.publish(tracker);
    for (auto &[code, duration] : snapshot->down) {
      CHECK_FALSE(snapshot->isHeld(code));
    }
    CHECK(snapshot->down.size() == 4);
    CHECK(publisher.publish(tracker)->down.empty());
  }

  SECTION("Scroll accumulates and resets") {
    tracker.addScroll(3.0f);
    tracker.addScroll(-1.0f);
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->scroll == 2.0f);
    CHECK(tracker.getScroll() == 0.0f);
    CHECK(publisher.publish(tracker)->scroll == 0.0f);
  }

  SECTION("Published snapshots are not affected by later ticks") {
    tracker.recordPress(InputCode::A);
    tracker.setPointer(int2(5, 6));
    auto first = publisher.publish(tracker);
    tracker.recordRelease(InputCode::A);
    tracker.recordPress(InputCode::B);
    tracker.setPointer(int2(7, 8));
    publisher.publish(tracker);
    publisher.publish(tracker);

    CHECK(first->down.size() == 1);
    CHECK(first->getDuration(InputCode::A) == 0);
    CHECK(first->pointer == int2(5, 6));
    CHECK(first->tick == 1);
    CHECK(publisher.getNumPublished() == 3);
  }
}

TEST_CASE("Event normalizer") {
  PressTracker tracker;
  SnapshotPublisher publisher;
  EventNormalizer normalizer(KeyMap::win32(), tracker);

  SECTION("Modifier decomposition") {
    normalizer.apply(keyDown(VK_A, ShiftMask));
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isHeld(InputCode::Shift));
    CHECK(snapshot->isHeld(InputCode::A));

    normalizer.apply(keyDown(VK_B, ShiftMask | ControlMask));
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->getDuration(InputCode::Shift) == 1);
    CHECK(snapshot->getDuration(InputCode::Control) == 0);

    normalizer.apply(keyUp(VK_A, ControlMask));
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::Shift));
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->isHeld(InputCode::Control));
    CHECK(snapshot->isHeld(InputCode::B));
  }

  SECTION("Events without modifier information keep modifiers") {
    normalizer.apply(keyDown(VK_A, ShiftMask));
    normalizer.apply(RawEvent{.kind = RawEventKind::MouseMove, .pointer = int2(1, 2)});
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isHeld(InputCode::Shift));
  }

  SECTION("Modifier key and mask agree") {
    normalizer.apply(keyDown(VK_SHIFT, ShiftMask));
    CHECK(publisher.publish(tracker)->isHeld(InputCode::Shift));
    normalizer.apply(keyUp(VK_SHIFT, 0));
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::Shift));
    CHECK(snapshot->getHeldTicks(InputCode::Shift) == 0);
  }

  SECTION("Modifier stays down while its other key is held") {
    normalizer.apply(keyDown(VK_LWIN, CommandMask));
    CHECK(publisher.publish(tracker)->isHeld(InputCode::Command));
    normalizer.apply(keyDown(VK_RWIN, CommandMask));
    CHECK(publisher.publish(tracker)->getDuration(InputCode::Command) == 1);

    normalizer.apply(keyUp(VK_RWIN, CommandMask));
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isHeld(InputCode::Command));
    CHECK(snapshot->getDuration(InputCode::Command) == 2);

    normalizer.apply(keyUp(VK_LWIN, 0));
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::Command));
    CHECK(snapshot->getHeldTicks(InputCode::Command) == 2);
  }

  SECTION("Unmapped codes are dropped") {
    normalizer.apply(keyDown(0xFF));
    normalizer.apply(RawEvent{.kind = RawEventKind::MouseDown, .code = 0x40});
    CHECK(publisher.publish(tracker)->down.empty());
  }

  SECTION("Pointer movement") {
    normalizer.apply(RawEvent{.kind = RawEventKind::MouseMove, .pointer = int2(10, 20)});
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->pointer == int2(10, 20));
    CHECK(snapshot->down.empty());
  }

  SECTION("Mouse buttons") {
    normalizer.apply(RawEvent{.kind = RawEventKind::MouseDown, .code = VK_LBUTTON, .pointer = int2(3, 4)});
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isHeld(InputCode::MouseLeft));
    CHECK(snapshot->pointer == int2(3, 4));
    normalizer.apply(RawEvent{.kind = RawEventKind::MouseUp, .code = VK_LBUTTON});
    CHECK(publisher.publish(tracker)->isReleased(InputCode::MouseLeft));
  }

  SECTION("Touch") {
    normalizer.apply(RawEvent{.kind = RawEventKind::TouchBegin, .pointer = int2(100, 50)});
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->isHeld(InputCode::Touch));
    CHECK(snapshot->pointer == int2(100, 50));

    normalizer.apply(RawEvent{.kind = RawEventKind::TouchMove, .pointer = int2(110, 55)});
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->getDuration(InputCode::Touch) == 1);
    CHECK(snapshot->pointer == int2(110, 55));

    normalizer.apply(RawEvent{.kind = RawEventKind::TouchEnd});
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->isReleased(InputCode::Touch));
    CHECK(snapshot->pointer == int2(110, 55));
  }

  SECTION("Scroll") {
    normalizer.apply(RawEvent{.kind = RawEventKind::Scroll, .scroll = 3.0f});
    normalizer.apply(RawEvent{.kind = RawEventKind::Scroll, .scroll = -1.0f});
    auto snapshot = publisher.publish(tracker);
    CHECK(snapshot->scroll == 2.0f);
    CHECK(tracker.getScroll() == 0.0f);
  }

  SECTION("Resize") {
    normalizer.apply(windowEvent(RawEventKind::Resized));
    CHECK(publisher.publish(tracker)->resized);
    CHECK_FALSE(publisher.publish(tracker)->resized);

    normalizer.apply(windowEvent(RawEventKind::Moved));
    CHECK(publisher.publish(tracker)->resized);
    CHECK_FALSE(publisher.publish(tracker)->resized);
  }

  SECTION("Focus loss") {
    normalizer.apply(keyDown(VK_A, ShiftMask));
    publisher.publish(tracker);
    publisher.publish(tracker);

    normalizer.apply(windowEvent(RawEventKind::FocusLost));
    auto snapshot = publisher.publish(tracker);
    CHECK_FALSE(snapshot->focus);
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->getHeldTicks(InputCode::A) == 1);
    CHECK(snapshot->isReleased(InputCode::Shift));

    for (int i = 0; i < 3; i++) {
      snapshot = publisher.publish(tracker);
      CHECK(snapshot->down.empty());
    }

    // Presses while unfocused are ignored, including modifiers
    normalizer.apply(keyDown(VK_B, ShiftMask));
    CHECK(publisher.publish(tracker)->down.empty());

    // The still set modifier bit is picked up once focus returns
    normalizer.apply(windowEvent(RawEventKind::FocusGained));
    normalizer.apply(keyDown(VK_A, ShiftMask));
    snapshot = publisher.publish(tracker);
    CHECK(snapshot->focus);
    CHECK(snapshot->isHeld(InputCode::Shift));
    CHECK(snapshot->isHeld(InputCode::A));
  }

  SECTION("Iconify behaves like focus loss") {
    normalizer.apply(keyDown(VK_A));
    publisher.publish(tracker);
    normalizer.apply(windowEvent(RawEventKind::Iconified));
    auto snapshot = publisher.publish(tracker);
    CHECK_FALSE(snapshot->focus);
    CHECK(snapshot->isReleased(InputCode::A));

    normalizer.apply(windowEvent(RawEventKind::Uniconified));
    CHECK(publisher.publish(tracker)->focus);
  }
}

TEST_CASE("Aggregator configuration") {
  std::map<std::string, std::string> env;
  auto getEnv = [&](const char *name) -> const char * {
    auto it = env.find(name);
    return it == env.end() ? nullptr : it->second.c_str();
  };

  SECTION("Defaults") {
    auto config = AggregatorConfig::fromEnvironment(getEnv);
    CHECK(config.queueMode == QueueMode::Confined);
    CHECK(config.queueCapacity == AggregatorConfig::DefaultQueueCapacity);
    CHECK(config.initialFocus);
    CHECK(config.deferSameTickRelease);
    CHECK(config.releaseOnDestructiveResize);
  }

  SECTION("Overrides") {
    env["TACTILE_INPUT_QUEUE_MODE"] = "concurrent";
    env["TACTILE_INPUT_QUEUE_CAPACITY"] = " 64 ";
    env["TACTILE_INPUT_INITIAL_FOCUS"] = "off";
    env["TACTILE_INPUT_DEFER_SAME_TICK_RELEASE"] = "FALSE";
    env["TACTILE_INPUT_RELEASE_ON_DESTRUCTIVE_RESIZE"] = "0";
    auto config = AggregatorConfig::fromEnvironment(getEnv);
    CHECK(config.queueMode == QueueMode::Concurrent);
    CHECK(config.queueCapacity == 64);
    CHECK_FALSE(config.initialFocus);
    CHECK_FALSE(config.deferSameTickRelease);
    CHECK_FALSE(config.releaseOnDestructiveResize);
  }

  SECTION("Invalid values keep defaults") {
    env["TACTILE_INPUT_QUEUE_MODE"] = "shared";
    env["TACTILE_INPUT_QUEUE_CAPACITY"] = "-5";
    env["TACTILE_INPUT_INITIAL_FOCUS"] = "maybe";
    auto config = AggregatorConfig::fromEnvironment(getEnv);
    CHECK(config.queueMode == QueueMode::Confined);
    CHECK(config.queueCapacity == AggregatorConfig::DefaultQueueCapacity);
    CHECK(config.initialFocus);
  }
}

TEST_CASE("Event queue") {
  SECTION("Confined queue keeps order") {
    EventQueue queue(QueueMode::Confined, 8);
    CHECK(queue.push(keyDown(VK_A)));
    CHECK(queue.push(keyUp(VK_A)));
    std::vector<RawEvent> events;
    CHECK(queue.drain([&](const RawEvent &event) { events.push_back(event); }) == 2);
    REQUIRE(events.size() == 2);
    CHECK(events[0] == keyDown(VK_A));
    CHECK(events[1] == keyUp(VK_A));
    CHECK(queue.drain([&](const RawEvent &event) { events.push_back(event); }) == 0);
  }

  SECTION("Confined queue rejects other threads") {
    EventQueue queue(QueueMode::Confined, 8);
    queue.push(keyDown(VK_A));
    auto result = std::async(std::launch::async, [&]() { return queue.push(keyUp(VK_A)); });
    CHECK_THROWS_AS(result.get(), std::logic_error);
  }

  SECTION("Overflow") {
    for (auto mode : {QueueMode::Confined, QueueMode::Concurrent}) {
      EventQueue queue(mode, 2);
      CHECK(queue.push(keyDown(VK_A)));
      CHECK(queue.push(keyDown(VK_B)));
      CHECK_FALSE(queue.push(keyUp(VK_A)));
      CHECK_FALSE(queue.push(keyUp(VK_B)));
      CHECK(queue.consumeOverflow());
      CHECK_FALSE(queue.consumeOverflow());
      CHECK(queue.drain([](const RawEvent &) {}) == 2);
      CHECK(queue.push(keyUp(VK_A)));
      CHECK_FALSE(queue.consumeOverflow());
    }
  }

  SECTION("Zero capacity") { CHECK_THROWS_AS(EventQueue(QueueMode::Confined, 0), std::logic_error); }
}

struct TestEventSource : public IRawEventSource {
  std::vector<RawEvent> pending;
  std::optional<int2> pointer;

  void drain(std::vector<RawEvent> &outEvents) override {
    outEvents.insert(outEvents.end(), pending.begin(), pending.end());
    pending.clear();
  }
  std::optional<int2> getPointerPosition() const override { return pointer; }
  const KeyMap &getKeyMap() const override { return KeyMap::win32(); }
};

TEST_CASE("Input aggregator") {
  AggregatorConfig config;

  SECTION("Pull model") {
    TestEventSource source;
    InputAggregator aggregator(config, source.getKeyMap());

    source.pending.push_back(keyDown(VK_A, ShiftMask));
    source.pointer = int2(12, 34);
    auto snapshot = aggregator.poll(source);
    CHECK(snapshot->isHeld(InputCode::A));
    CHECK(snapshot->isHeld(InputCode::Shift));
    CHECK(snapshot->pointer == int2(12, 34));
    CHECK(source.pending.empty());
    CHECK(aggregator.getLastSnapshot() == snapshot);

    source.pending.push_back(keyUp(VK_A, ShiftMask));
    snapshot = aggregator.poll(source);
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->getDuration(InputCode::Shift) == 1);
  }

  SECTION("Queued events are applied on poll") {
    InputAggregator aggregator(config, KeyMap::win32());
    CHECK(aggregator.push(keyDown(VK_A)));
    CHECK(aggregator.push(RawEvent{.kind = RawEventKind::Scroll, .scroll = 3.0f}));
    CHECK(aggregator.push(RawEvent{.kind = RawEventKind::Scroll, .scroll = -1.0f}));
    auto snapshot = aggregator.poll();
    CHECK(snapshot->isHeld(InputCode::A));
    CHECK(snapshot->scroll == 2.0f);
    CHECK(aggregator.poll()->scroll == 0.0f);
  }

  SECTION("Initial focus") {
    config.initialFocus = false;
    InputAggregator aggregator(config, KeyMap::win32());
    aggregator.push(keyDown(VK_A));
    auto snapshot = aggregator.poll();
    CHECK_FALSE(snapshot->focus);
    CHECK(snapshot->down.empty());
  }

  SECTION("Overflow releases everything") {
    config.queueCapacity = 4;
    InputAggregator aggregator(config, KeyMap::win32());
    aggregator.push(keyDown(VK_A));
    CHECK(aggregator.poll()->isHeld(InputCode::A));

    for (int i = 0; i < 4; i++)
      CHECK(aggregator.push(RawEvent{.kind = RawEventKind::MouseMove, .pointer = int2(i, i)}));
    CHECK_FALSE(aggregator.push(keyUp(VK_A)));

    auto snapshot = aggregator.poll();
    CHECK(snapshot->isReleased(InputCode::A));
    CHECK(snapshot->pointer == int2(3, 3));
    CHECK(aggregator.poll()->down.empty());
  }

  SECTION("Immediate resize notification") {
    InputAggregator aggregator(config, KeyMap::win32());
    std::atomic<int> numHandled{};
    std::atomic<bool> lastDestructive{};
    aggregator.setResizeHandler([&](bool destructive) {
      lastDestructive = destructive;
      ++numHandled;
    });

    aggregator.push(keyDown(VK_A));
    aggregator.poll();

    std::async(std::launch::async, [&]() { aggregator.notifyResized(false); }).wait();
    CHECK(numHandled == 1);
    CHECK_FALSE(lastDestructive);
    auto snapshot = aggregator.poll();
    CHECK(snapshot->resized);
    CHECK(snapshot->isHeld(InputCode::A));
    CHECK_FALSE(aggregator.poll()->resized);

    std::async(std::launch::async, [&]() { aggregator.notifyResized(true); }).wait();
    CHECK(numHandled == 2);
    CHECK(lastDestructive);
    snapshot = aggregator.poll();
    CHECK(snapshot->resized);
    CHECK(snapshot->isReleased(InputCode::A));
  }

  SECTION("Destructive resize without release") {
    config.releaseOnDestructiveResize = false;
    InputAggregator aggregator(config, KeyMap::win32());
    aggregator.push(keyDown(VK_A));
    aggregator.poll();
    aggregator.notifyResized(true);
    auto snapshot = aggregator.poll();
    CHECK(snapshot->resized);
    CHECK(snapshot->isHeld(InputCode::A));
  }

  SECTION("Separate aggregators are independent") {
    InputAggregator first(config, KeyMap::win32());
    InputAggregator second(config, KeyMap::darwin());
    first.push(keyDown(VK_A));
    second.push(keyDown(0x0B));
    CHECK(first.poll()->isHeld(InputCode::A));
    auto snapshot = second.poll();
    CHECK(snapshot->isHeld(InputCode::B));
    CHECK_FALSE(snapshot->contains(InputCode::A));
  }
}

static void threadedTestCase(size_t numPresses, std::chrono::microseconds producerDelay,
                             std::chrono::microseconds consumerDelay) {
  AggregatorConfig config{.queueMode = QueueMode::Concurrent, .queueCapacity = 4096};
  InputAggregator aggregator(config, KeyMap::win32());

  std::atomic<bool> producerDone{};
  auto producer = std::async(std::launch::async, [&]() {
    for (size_t i = 0; i < numPresses; i++) {
      aggregator.push(keyDown(VK_A));
      aggregator.push(RawEvent{.kind = RawEventKind::MouseMove, .pointer = int2(int(i), 0)});
      std::this_thread::sleep_for(producerDelay);
      aggregator.push(keyUp(VK_A));
    }
    producerDone = true;
  });

  size_t numTimesPressed{};
  while (!producerDone) {
    auto snapshot = aggregator.poll();
    if (auto duration = snapshot->getDuration(InputCode::A)) {
      CHECK(heldTicks(*duration) >= 0);
      if (*duration == 0)
        ++numTimesPressed;
    }
    std::this_thread::sleep_for(consumerDelay);
  }
  producer.wait();

  // Apply whatever is still queued, then let the last release pass through
  for (int i = 0; i < 2; i++) {
    auto snapshot = aggregator.poll();
    if (snapshot->getDuration(InputCode::A) == 0)
      ++numTimesPressed;
  }
  auto last = aggregator.poll();
  CHECK_FALSE(last->contains(InputCode::A));
  CHECK(last->pointer == int2(int(numPresses) - 1, 0));
  CHECK(numTimesPressed >= 1);
  CHECK(numTimesPressed <= numPresses);
}

using namespace std::chrono_literals;
TEST_CASE("Concurrent producer 1") { threadedTestCase(64, 1000us, 1500us); }
TEST_CASE("Concurrent producer 2") { threadedTestCase(64, 100us, 4000us); }
TEST_CASE("Concurrent producer 3") { threadedTestCase(512, 0us, 200us); }

TEST_CASE("Debug formatting") {
  auto str = debugFormat(RawEvent{.kind = RawEventKind::MouseDown, .code = 1, .modifiers = ShiftMask, .pointer = int2(1, 2)});
  CHECK(str.find("MouseDown") != std::string::npos);
  CHECK(str.find("0x20000") != std::string::npos);

  PressTracker tracker;
  SnapshotPublisher publisher;
  tracker.recordPress(InputCode::Shift);
  publisher.publish(tracker);
  tracker.recordRelease(InputCode::Shift);
  auto snapshotStr = debugFormat(*publisher.publish(tracker));
  CHECK(snapshotStr.find("Shift: released after 0") != std::string::npos);
  CHECK(snapshotStr.find("tick: 2") != std::string::npos);
}

int main(int argc, char *argv[]) {
  Catch::Session session;

  int returnCode = session.applyCommandLine(argc, argv);
  if (returnCode != 0) // Indicates a command line error
    return returnCode;

  getLogger()->set_level(spdlog::level::debug);

  return session.run();
}
