#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"
#include <string>
#include <vector>

using srx::KeyboardEventType;

TEST_CASE("emitter runs listeners in registration order", "[keyboard]") {
  KeyboardEmitter kb;
  std::vector<int> order;
  auto a = kb.addListener(KeyboardEventType::WillShow, [&](const auto &) { order.push_back(1); });
  auto b = kb.addListener(KeyboardEventType::WillShow, [&](const auto &) { order.push_back(2); });
  auto c = kb.addListener(KeyboardEventType::DidHide, [&](const auto &) { order.push_back(3); });

  kb.publish(KeyboardEventType::WillShow, keyboardAt(500));
  REQUIRE(order == std::vector<int>{1, 2});
  REQUIRE(kb.listenerCount(KeyboardEventType::WillShow) == 2);
  REQUIRE(kb.listenerCount(KeyboardEventType::DidHide) == 1);
}

TEST_CASE("subscription removal is idempotent and scoped", "[keyboard]") {
  KeyboardEmitter kb;
  int calls = 0;
  {
    Subscription s = kb.addListener(KeyboardEventType::DidShow, [&](const auto &) { ++calls; });
    REQUIRE(s.active());
    kb.publish(KeyboardEventType::DidShow, std::nullopt);
    s.remove();
    s.remove();
    REQUIRE_FALSE(s.active());
    kb.publish(KeyboardEventType::DidShow, std::nullopt);
  }
  REQUIRE(calls == 1);

  {
    Subscription scoped = kb.addListener(KeyboardEventType::DidShow, [&](const auto &) { ++calls; });
    Subscription moved = std::move(scoped);
    REQUIRE_FALSE(scoped.active());
    REQUIRE(kb.listenerCount(KeyboardEventType::DidShow) == 1);
  }
  REQUIRE(kb.listenerCount(KeyboardEventType::DidShow) == 0);

  Subscription empty;
  empty.remove();
  REQUIRE_FALSE(empty.active());
}

TEST_CASE("a listener may remove itself while being dispatched", "[keyboard]") {
  KeyboardEmitter kb;
  int first = 0, second = 0;
  Subscription s1;
  s1 = kb.addListener(KeyboardEventType::WillHide, [&](const auto &) {
    ++first;
    s1.remove();
  });
  auto s2 = kb.addListener(KeyboardEventType::WillHide, [&](const auto &) { ++second; });
  kb.publish(KeyboardEventType::WillHide, std::nullopt);
  kb.publish(KeyboardEventType::WillHide, std::nullopt);
  REQUIRE(first == 1);
  REQUIRE(second == 2);
}

TEST_CASE("subscription outliving its emitter is harmless", "[keyboard]") {
  Subscription s;
  {
    KeyboardEmitter kb;
    s = kb.addListener(KeyboardEventType::WillShow, [](const auto &) {});
  }
  s.remove();
  REQUIRE_FALSE(s.active());
}

TEST_CASE("attach subscribes four listeners, detach releases them once", "[keyboard]") {
  Harness h;
  auto &r = h.mount();
  for (auto t : {KeyboardEventType::WillShow, KeyboardEventType::DidShow,
                 KeyboardEventType::WillHide, KeyboardEventType::DidHide})
    REQUIRE(h.keyboard.listenerCount(t) == 1);

  r.attach(); // already attached
  REQUIRE(h.keyboard.listenerCount(KeyboardEventType::WillShow) == 1);

  r.detach();
  r.detach();
  REQUIRE_FALSE(r.attached());
  for (auto t : {KeyboardEventType::WillShow, KeyboardEventType::DidShow,
                 KeyboardEventType::WillHide, KeyboardEventType::DidHide})
    REQUIRE(h.keyboard.listenerCount(t) == 0);

  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(400));
  REQUIRE_FALSE(r.keyboardWillOpenTo());

  r.attach();
  h.responder.reset();
  REQUIRE(h.keyboard.listenerCount(KeyboardEventType::DidHide) == 0);
}

TEST_CASE("legacy boolean policy warns at attach", "[keyboard][config]") {
  Harness h;
  h.props.keyboardShouldPersistTaps = true;
  h.mount();
  REQUIRE(h.log.warnings.size() == 1);
  REQUIRE(h.log.warnings[0].find("keyboardShouldPersistTaps=\"always\"") != std::string::npos);

  Harness quiet;
  quiet.mount();
  REQUIRE(quiet.log.warnings.empty());
}

TEST_CASE("keyboard frame tracks show and hide", "[keyboard]") {
  Harness h;
  auto &r = h.mount();

  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(500));
  REQUIRE(r.keyboardWillOpenTo()->endCoordinates.screenY == 500.f);

  SECTION("didShow without payload keeps the willShow frame") {
    h.keyboard.publish(KeyboardEventType::DidShow, std::nullopt);
    REQUIRE(r.keyboardWillOpenTo()->endCoordinates.screenY == 500.f);
  }
  SECTION("didShow with payload replaces it") {
    h.keyboard.publish(KeyboardEventType::DidShow, keyboardAt(450));
    REQUIRE(r.keyboardWillOpenTo()->endCoordinates.screenY == 450.f);
  }
  SECTION("willHide clears") {
    h.keyboard.publish(KeyboardEventType::WillHide, keyboardAt(800));
    REQUIRE_FALSE(r.keyboardWillOpenTo());
  }
  SECTION("didHide clears") {
    h.keyboard.publish(KeyboardEventType::DidHide, keyboardAt(800));
    REQUIRE_FALSE(r.keyboardWillOpenTo());
  }
}

TEST_CASE("host keyboard callbacks see the updated frame", "[keyboard]") {
  Harness h;
  std::vector<std::string> seen;
  h.props.onKeyboardWillShow = [&](const std::optional<srx::KeyboardEvent> &) {
    REQUIRE(h.responder->keyboardWillOpenTo());
    seen.push_back("willShow");
  };
  h.props.onKeyboardDidShow = [&](const std::optional<srx::KeyboardEvent> &) { seen.push_back("didShow"); };
  h.props.onKeyboardWillHide = [&](const std::optional<srx::KeyboardEvent> &) {
    REQUIRE_FALSE(h.responder->keyboardWillOpenTo());
    seen.push_back("willHide");
  };
  h.props.onKeyboardDidHide = [&](const std::optional<srx::KeyboardEvent> &) { seen.push_back("didHide"); };
  h.mount();

  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(500));
  h.keyboard.publish(KeyboardEventType::DidShow, std::nullopt);
  h.keyboard.publish(KeyboardEventType::WillHide, keyboardAt(800));
  h.keyboard.publish(KeyboardEventType::DidHide, keyboardAt(800));
  REQUIRE(seen == std::vector<std::string>{"willShow", "didShow", "willHide", "didHide"});
}

TEST_CASE("scroll to keyboard lifts the target above the keyboard", "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();
  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(500));

  r.scrollNativeHandleToKeyboard(42, 10.f);
  REQUIRE(h.sink.commands.empty()); // waits for the measurement
  REQUIRE(h.sink.pending.size() == 1);
  REQUIRE(h.sink.pending[0].target == 42);
  REQUIRE(h.sink.pending[0].relativeTo == Harness::kInner);

  h.sink.succeed(0.f, 700.f, 200.f, 40.f);
  REQUIRE(h.sink.commands.size() == 1);
  const auto &c = h.sink.commands[0];
  REQUIRE(c.name == "scrollTo");
  REQUIRE(std::get<double>(c.args[0]) == 0.0);
  REQUIRE(std::get<double>(c.args[1]) == 250.0); // 700 - 500 + 40 + 10
  REQUIRE(std::get<bool>(c.args[2]) == true);
}

TEST_CASE("negative offsets are clamped only on request", "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();
  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(500));

  r.scrollNativeHandleToKeyboard(42, 0.f, true);
  h.sink.succeed(0.f, 400.f, 200.f, 60.f); // raw offset -40
  REQUIRE(std::get<double>(h.sink.commands.back().args[1]) == 0.0);

  // one-shot: the clamp does not stick to the next request
  r.scrollNativeHandleToKeyboard(42);
  h.sink.succeed(0.f, 400.f, 200.f, 60.f);
  REQUIRE(std::get<double>(h.sink.commands.back().args[1]) == -40.0);
}

TEST_CASE("without a keyboard frame the window height is used", "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();

  r.scrollNativeHandleToKeyboard(42);
  h.sink.succeed(0.f, 900.f, 200.f, 50.f);
  REQUIRE(std::get<double>(h.sink.commands.back().args[1]) == 150.0); // 900 - 800 + 50
}

TEST_CASE("a hide before the measurement completes falls back to window height",
          "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();
  h.keyboard.publish(KeyboardEventType::WillShow, keyboardAt(500));
  r.scrollNativeHandleToKeyboard(42);
  h.keyboard.publish(KeyboardEventType::WillHide, keyboardAt(800));
  h.sink.succeed(0.f, 900.f, 200.f, 50.f);
  REQUIRE(std::get<double>(h.sink.commands.back().args[1]) == 150.0);
}

TEST_CASE("measurement failure is reported and nothing scrolls", "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();
  r.scrollNativeHandleToKeyboard(42, 30.f, true);
  h.sink.fail("view not found");
  REQUIRE(h.sink.commands.empty());
  REQUIRE(h.log.errors.size() == 1);
  REQUIRE(h.log.errors[0] == "Error measuring text field: view not found");
}

TEST_CASE("missing inner view aborts scroll to keyboard", "[keyboard][scroll-to]") {
  Harness h;
  h.nodes.innerView.reset();
  auto &r = h.mount();
  r.scrollNativeHandleToKeyboard(42);
  REQUIRE(h.sink.pending.empty());
  REQUIRE(h.sink.commands.empty());
  REQUIRE(h.log.errors.size() == 1);
}

TEST_CASE("a measurement finishing after unmount is dropped", "[keyboard][scroll-to]") {
  Harness h;
  auto &r = h.mount();
  r.scrollNativeHandleToKeyboard(42);
  h.responder.reset();
  h.sink.succeed(0.f, 900.f, 200.f, 50.f);
  REQUIRE(h.sink.commands.empty());
}
