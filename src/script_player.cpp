#include "script_player.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

void ReplayCommandSink::dispatchCommand(srx::NodeHandle target, const std::string &name,
                                        const CommandArgs &args) {
  issued_.push_back(formatCommand(target, name, args));
  if (listener_)
    listener_(issued_.back());
}

void ReplayCommandSink::measureLayout(srx::NodeHandle target, srx::NodeHandle relativeTo,
                                      MeasureError onError, MeasureSuccess onSuccess) {
  auto t = layouts_.find(target);
  auto rel = layouts_.find(relativeTo);
  if (t == layouts_.end()) {
    std::string msg = "no layout for node " + std::to_string(target);
    pending_.push_back([onError, msg]() { onError(msg); });
    return;
  }
  // unknown reference node counts as the origin
  const srx::rect a = t->second;
  const srx::rect b = rel == layouts_.end() ? srx::rect{} : rel->second;
  pending_.push_back(
      [onSuccess, a, b]() { onSuccess(a.x - b.x, a.y - b.y, a.width, a.height); });
}

size_t ReplayCommandSink::flushPending() {
  size_t n = 0;
  // completions may queue further measurements
  while (!pending_.empty()) {
    auto batch = std::move(pending_);
    pending_.clear();
    for (auto &fn : batch) {
      fn();
      ++n;
    }
  }
  return n;
}

ScriptPlayer::ScriptPlayer(std::ostream &out, ResponderLog &log, const ReplayOptions &opts)
    : out_(out), log_(log), opts_(opts), epochMs_(std::max(0.0, opts.animatingThresholdMs)),
      clock_(epochMs_), tracker_(&log),
      platform_(opts.zoomSupported, opts.windowHeight) {
  props_.keyboardShouldPersistTaps = opts.persistTaps;
  props_.disableScrollViewPanResponder = opts.disablePanResponder;
  installHostCallbacks();

  FrameRateLogger::Options fr;
  fr.debug = opts.traceInteractions;
  tracker_.setGlobalOptions(fr);
  tracker_.setContext("responder-replay");

  sink_.setListener([this](const std::string &cmd) { report("command " + cmd); });
  inputs_.setBlurHook([this](srx::NodeHandle h) { report("blur " + std::to_string(h)); });
  inputs_.setFocusHook([this](srx::NodeHandle h) { report("focus " + std::to_string(h)); });

  ScrollNodes nodes;
  nodes.scrollable = kScrollableNode;
  nodes.innerView = kInnerViewNode;
  nodes.nativeScrollRef = kNativeScrollRef;
  sink_.setLayout(kInnerViewNode, srx::rect{});

  responder_ = std::make_unique<ScrollResponder>(
      props_, nodes, ResponderServices{inputs_, tracker_, keyboard_, sink_, platform_, clock_, log_},
      opts.animatingThresholdMs);
  responder_->attach();
}

ScriptPlayer::~ScriptPlayer() { responder_->detach(); }

void ScriptPlayer::report(const std::string &what) {
  out_ << "[" << scriptMs_ << "] " << what << '\n';
}

static std::string describe(const srx::PressEvent &e) {
  std::ostringstream os;
  os << "target=";
  if (e.target)
    os << *e.target;
  else
    os << "none";
  os << " touches=" << e.touches;
  return os.str();
}

static std::string describe(const srx::ScrollEvent &e) {
  std::ostringstream os;
  os << "y=" << e.contentOffset.y;
  if (e.velocity)
    os << " v=" << e.velocity->x << ',' << e.velocity->y;
  return os.str();
}

static std::string describe(const std::optional<srx::KeyboardEvent> &e) {
  if (!e)
    return "no payload";
  std::ostringstream os;
  os << "screenY=" << e->endCoordinates.screenY;
  return os.str();
}

void ScriptPlayer::installHostCallbacks() {
  auto press = [this](const char *name) {
    return [this, name](const srx::PressEvent &e) { report(std::string("host ") + name + " " + describe(e)); };
  };
  auto scroll = [this](const char *name) {
    return [this, name](const srx::ScrollEvent &e) { report(std::string("host ") + name + " " + describe(e)); };
  };
  auto keyboard = [this](const char *name) {
    return [this, name](const std::optional<srx::KeyboardEvent> &e) {
      report(std::string("host ") + name + " " + describe(e));
    };
  };
  props_.onResponderGrant = press("onResponderGrant");
  props_.onResponderRelease = press("onResponderRelease");
  props_.onScrollResponderKeyboardDismissed = press("onScrollResponderKeyboardDismissed");
  props_.onMomentumScrollBegin = scroll("onMomentumScrollBegin");
  props_.onMomentumScrollEnd = scroll("onMomentumScrollEnd");
  props_.onScrollBeginDrag = scroll("onScrollBeginDrag");
  props_.onScrollEndDrag = scroll("onScrollEndDrag");
  props_.onKeyboardWillShow = keyboard("onKeyboardWillShow");
  props_.onKeyboardDidShow = keyboard("onKeyboardDidShow");
  props_.onKeyboardWillHide = keyboard("onKeyboardWillHide");
  props_.onKeyboardDidHide = keyboard("onKeyboardDidHide");
}

bool ScriptPlayer::play(const EventScript &script) {
  error_.clear();
  for (const auto &ev : script.events) {
    scriptMs_ = ev.timeMs;
    clock_.setNowMs(epochMs_ + ev.timeMs);
    try {
      if (!step(ev))
        return false;
    } catch (const std::logic_error &ex) {
      error_ = "line " + std::to_string(ev.line) + ": " + ex.what();
      return false;
    }
    sink_.flushPending();
  }
  return true;
}

bool ScriptPlayer::step(const ScriptEvent &ev) {
  const std::string &n = ev.name;
  auto fail = [&](const std::string &why) {
    error_ = "line " + std::to_string(ev.line) + ": " + why;
    return false;
  };
  // a key that is present but malformed stops the run instead of falling back
  auto badValue = [&](const char *key) {
    return std::invalid_argument(std::string("bad value for '") + key + "': '" +
                                 ev.args.at(key) + "'");
  };
  auto num = [&](const char *key, double fallback) {
    if (!ev.has(key))
      return fallback;
    double v = 0;
    if (!ev.number(key, v) || std::fabs(v) > std::numeric_limits<float>::max())
      throw badValue(key);
    return v;
  };
  auto integer = [&](const char *key) -> std::optional<int> {
    if (!ev.has(key))
      return std::nullopt;
    int v = 0;
    if (!ev.integer(key, v))
      throw badValue(key);
    return v;
  };
  auto target = [&]() -> std::optional<srx::NodeHandle> { return integer("target"); };
  auto press = [&](int defaultTouches) {
    srx::PressEvent e;
    e.target = target();
    e.touches = integer("touches").value_or(defaultTouches);
    if (e.touches < 0)
      throw badValue("touches");
    e.location = {float(num("x", 0)), float(num("y", 0))};
    return e;
  };
  auto answer = [&](bool r) { report(n + " -> " + (r ? "true" : "false")); };
  auto keyboardPayload = [&]() {
    srx::KeyboardEvent k;
    k.endCoordinates.screenY = float(num("screenY", opts_.windowHeight));
    k.endCoordinates.height = float(num("height", 0));
    k.endCoordinates.width = float(num("width", 0));
    k.duration = num("duration", 0);
    return k;
  };

  ScrollResponder &r = *responder_;
  if (n == "touchStart") {
    r.handleTouchStart(press(1));
  } else if (n == "touchMove") {
    r.handleTouchMove(press(1));
  } else if (n == "touchEnd") {
    r.handleTouchEnd(press(0));
  } else if (n == "touchCancel") {
    r.handleTouchCancel(press(0));
  } else if (n == "captureShouldSet") {
    answer(r.handleStartShouldSetResponderCapture(press(1)));
  } else if (n == "startShouldSet") {
    answer(r.handleStartShouldSetResponder(press(1)));
  } else if (n == "scrollShouldSet") {
    answer(r.handleScrollShouldSetResponder());
  } else if (n == "terminationRequest") {
    answer(r.handleTerminationRequest());
  } else if (n == "reject") {
    r.handleResponderReject();
  } else if (n == "grant") {
    r.handleResponderGrant(press(1));
  } else if (n == "release") {
    r.handleResponderRelease(press(0));
  } else if (n == "scroll") {
    srx::ScrollEvent e;
    e.contentOffset = {float(num("x", 0)), float(num("y", 0))};
    r.handleScroll(e);
  } else if (n == "dragBegin") {
    r.handleScrollBeginDrag(srx::ScrollEvent{});
  } else if (n == "dragEnd") {
    srx::ScrollEvent e;
    if (ev.has("vx") || ev.has("vy"))
      e.velocity = srx::vec2{float(num("vx", 0)), float(num("vy", 0))};
    r.handleScrollEndDrag(e);
  } else if (n == "momentumBegin") {
    r.handleMomentumScrollBegin(srx::ScrollEvent{});
  } else if (n == "momentumEnd") {
    r.handleMomentumScrollEnd(srx::ScrollEvent{});
  } else if (n == "keyboardWillShow") {
    keyboard_.publish(srx::KeyboardEventType::WillShow, keyboardPayload());
  } else if (n == "keyboardDidShow") {
    std::optional<srx::KeyboardEvent> e;
    if (ev.has("screenY"))
      e = keyboardPayload();
    keyboard_.publish(srx::KeyboardEventType::DidShow, e);
  } else if (n == "keyboardWillHide") {
    keyboard_.publish(srx::KeyboardEventType::WillHide, keyboardPayload());
  } else if (n == "keyboardDidHide") {
    keyboard_.publish(srx::KeyboardEventType::DidHide, keyboardPayload());
  } else if (n == "registerInput") {
    auto t = target();
    if (!t)
      return fail("registerInput needs target=");
    inputs_.registerInput(*t);
  } else if (n == "focus") {
    auto t = target();
    if (!t || !inputs_.focusTextInput(*t))
      return fail("focus needs target= of a registered input");
  } else if (n == "layout") {
    auto t = target();
    if (!t)
      return fail("layout needs target=");
    sink_.setLayout(*t, srx::rect{float(num("left", 0)), float(num("top", 0)),
                                  float(num("width", 0)), float(num("height", 0))});
  } else if (n == "scrollToKeyboard") {
    auto t = target();
    if (!t)
      return fail("scrollToKeyboard needs target=");
    r.scrollNativeHandleToKeyboard(*t, float(num("offset", 0)), ev.flag("clamp", false));
  } else if (n == "scrollTo") {
    ScrollToOptions o;
    if (ev.has("x"))
      o.x = float(num("x", 0));
    if (ev.has("y"))
      o.y = float(num("y", 0));
    if (ev.has("animated"))
      o.animated = ev.flag("animated", true);
    r.scrollTo(o);
  } else if (n == "scrollToEnd") {
    ScrollToEndOptions o;
    if (ev.has("animated"))
      o.animated = ev.flag("animated", true);
    r.scrollToEnd(o);
  } else if (n == "zoom") {
    ZoomRect z{float(num("x", 0)), float(num("y", 0)), float(num("width", 0)),
               float(num("height", 0)), std::nullopt};
    if (ev.has("animated"))
      z.animated = ev.flag("animated", true);
    r.zoomToRect(z);
  } else if (n == "flash") {
    r.flashScrollIndicators();
  } else if (n == "state") {
    const ResponderState &s = r.state();
    std::ostringstream os;
    os << "state touching=" << s.isTouching() << " animating=" << r.isAnimating()
       << " observedScroll=" << s.observedScrollSinceBecomingResponder()
       << " grantedWhileAnimating=" << s.becameResponderWhileAnimating();
    report(os.str());
  } else {
    return fail("unknown event '" + n + "'");
  }
  return true;
}
