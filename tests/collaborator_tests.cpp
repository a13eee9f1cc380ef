#include <catch2/catch_test_macros.hpp>
#include "clock.hpp"
#include "frame_rate_logger.hpp"
#include "responder_state.hpp"
#include "test_support.hpp"
#include "text_input_state.hpp"
#include <sstream>

TEST_CASE("ResponderState starts zeroed", "[state]") {
  ResponderState s;
  REQUIRE_FALSE(s.isTouching());
  REQUIRE(s.lastMomentumScrollBeginTime() == 0.0);
  REQUIRE(s.lastMomentumScrollEndTime() == 0.0);
  REQUIRE_FALSE(s.observedScrollSinceBecomingResponder());
  REQUIRE_FALSE(s.becameResponderWhileAnimating());
  REQUIRE(s.animatingThresholdMs() == 16.0);
}

TEST_CASE("animating is a pure function of the two timestamps", "[state]") {
  ResponderState s;
  s.momentumEnd(100.0);
  REQUIRE(s.isAnimating(100.0));
  REQUIRE(s.isAnimating(115.0));
  REQUIRE_FALSE(s.isAnimating(116.0));
  // same inputs, same answer
  REQUIRE_FALSE(s.isAnimating(116.0));
  REQUIRE(s.isAnimating(110.0));

  s.momentumBegin(200.0);
  REQUIRE(s.isAnimating(5000.0));
  s.momentumEnd(300.0);
  REQUIRE_FALSE(s.isAnimating(400.0));
}

TEST_CASE("clocks can start clear of the animating window", "[state]") {
  const double threshold = ResponderState::kDefaultAnimatingThresholdMs;
  ResponderState s;
  SECTION("steady") {
    SteadyClock c(threshold);
    REQUIRE(c.nowMs() >= threshold);
    REQUIRE_FALSE(s.isAnimating(c.nowMs()));
  }
  SECTION("manual") {
    ManualClock c(threshold);
    REQUIRE_FALSE(s.isAnimating(c.nowMs()));
    c.setNowMs(threshold - 1.0);
    REQUIRE(s.isAnimating(c.nowMs()));
  }
}

TEST_CASE("TextInputState forgets every input on unregisterAll", "[text-input]") {
  TextInputState t;
  int blurs = 0;
  t.setBlurHook([&](srx::NodeHandle) { ++blurs; });
  t.registerInput(4);
  t.registerInput(5);
  REQUIRE(t.focusTextInput(5));

  t.unregisterAll();
  REQUIRE_FALSE(t.isTextInput(4));
  REQUIRE_FALSE(t.isTextInput(5));
  REQUIRE_FALSE(t.currentlyFocusedField());
  REQUIRE(blurs == 0);
  REQUIRE_FALSE(t.focusTextInput(4));

  t.registerInput(6);
  REQUIRE(t.focusTextInput(6));
}

TEST_CASE("TextInputState tracks focus among registered inputs", "[text-input]") {
  TextInputState t;
  std::vector<srx::NodeHandle> focused, blurred;
  t.setFocusHook([&](srx::NodeHandle h) { focused.push_back(h); });
  t.setBlurHook([&](srx::NodeHandle h) { blurred.push_back(h); });
  t.registerInput(1);
  t.registerInput(2);

  REQUIRE(t.isTextInput(1));
  REQUIRE_FALSE(t.isTextInput(3));
  REQUIRE_FALSE(t.focusTextInput(3));
  REQUIRE_FALSE(t.currentlyFocusedField());

  REQUIRE(t.focusTextInput(1));
  REQUIRE(t.focusTextInput(1));
  REQUIRE(focused == std::vector<srx::NodeHandle>{1});

  t.blurTextInput(2); // not the focused one
  REQUIRE(t.currentlyFocusedField() == 1);
  t.blurTextInput(1);
  t.blurTextInput(1);
  REQUIRE_FALSE(t.currentlyFocusedField());
  REQUIRE(blurred == std::vector<srx::NodeHandle>{1});

  t.focusTextInput(2);
  t.unregisterInput(2);
  REQUIRE_FALSE(t.currentlyFocusedField());
  REQUIRE_FALSE(t.isTextInput(2));
}

TEST_CASE("FrameRateLogger tolerates redundant ends", "[frame-rate]") {
  CaptureLog log;
  FrameRateLogger fr(&log);
  fr.endScroll();
  REQUIRE(fr.redundantEnds() == 1);

  fr.beginScroll();
  REQUIRE(fr.inScrollInteraction());
  fr.endScroll();
  fr.endScroll(); // drag end and momentum end both close it
  REQUIRE_FALSE(fr.inScrollInteraction());
  REQUIRE(fr.begunCount() == 1);
  REQUIRE(fr.endedCount() == 1);
  REQUIRE(fr.redundantEnds() == 2);
  REQUIRE(log.debugs.empty());
}

TEST_CASE("FrameRateLogger traces in debug mode", "[frame-rate]") {
  CaptureLog log;
  FrameRateLogger fr(&log);
  FrameRateLogger::Options o;
  o.debug = true;
  fr.setGlobalOptions(o);
  fr.setContext("list");
  fr.beginScroll();
  fr.endScroll();
  REQUIRE(log.debugs.size() == 2);
  REQUIRE(log.debugs[0] == "scroll interaction began (list)");
}

TEST_CASE("StderrLog prefixes levels and hides debug unless verbose", "[log]") {
  std::ostringstream os;
  StderrLog log(os);
  log.debug("hidden");
  log.warn("careful");
  log.error("broken");
  REQUIRE(os.str() == "[warn] careful\n[error] broken\n");

  log.setVerbose(true);
  log.debug("shown");
  REQUIRE(os.str().find("[debug] shown\n") != std::string::npos);
}

TEST_CASE("commands format for logs", "[commands]") {
  CommandArgs args{1.5, true, srx::rect(0, 0, 10, 20)};
  REQUIRE(formatCommand(3, "scrollTo", args) == "scrollTo@3(1.5, true, {0,0,10,20})");
  REQUIRE(formatCommand(3, "flashScrollIndicators", {}) == "flashScrollIndicators@3()");
}
