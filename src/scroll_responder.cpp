#include "scroll_responder.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

ScrollResponder::ScrollResponder(const ScrollProps &props, const ScrollNodes &nodes,
                                 ResponderServices services, double animatingThresholdMs)
    : props_(props), nodes_(nodes), svc_(services), state_(animatingThresholdMs),
      self_(std::make_shared<ScrollResponder *>(this)) {}

ScrollResponder::~ScrollResponder() { detach(); }

void ScrollResponder::attach() {
  if (attached_)
    return;
  if (persistTapsIsLegacy(props_)) {
    const bool b = std::get<bool>(props_.keyboardShouldPersistTaps);
    svc_.log.warn(std::string("'keyboardShouldPersistTaps={") + (b ? "true" : "false") +
                  "}' is deprecated. Use 'keyboardShouldPersistTaps=\"" + (b ? "always" : "never") +
                  "\"' instead");
  }

  keyboardWillOpenTo_.reset();
  additionalScrollOffset_ = 0.f;
  preventNegativeScrollOffset_ = false;

  using srx::KeyboardEventType;
  auto &kb = svc_.keyboard;
  subWillShow_ = kb.addListener(KeyboardEventType::WillShow,
                                [this](const auto &e) { handleKeyboardWillShow(e); });
  subWillHide_ = kb.addListener(KeyboardEventType::WillHide,
                                [this](const auto &e) { handleKeyboardWillHide(e); });
  subDidShow_ = kb.addListener(KeyboardEventType::DidShow,
                               [this](const auto &e) { handleKeyboardDidShow(e); });
  subDidHide_ = kb.addListener(KeyboardEventType::DidHide,
                               [this](const auto &e) { handleKeyboardDidHide(e); });
  attached_ = true;
  svc_.log.debug(std::string("scroll responder attached, keyboardShouldPersistTaps=") +
                 toString(effectivePersistTaps(props_)));
}

void ScrollResponder::detach() {
  subWillShow_.remove();
  subWillHide_.remove();
  subDidShow_.remove();
  subDidHide_.remove();
  attached_ = false;
}

bool ScrollResponder::isAnimating() const { return state_.isAnimating(svc_.clock.nowMs()); }

// --- responder negotiation ---

bool ScrollResponder::handleScrollShouldSetResponder() const {
  // a disabled pan responder lets every touch pass through
  if (props_.disableScrollViewPanResponder)
    return false;
  return state_.isTouching();
}

// Bubble phase: nested views get first claim. With "handled", a tap that no
// child took still dismisses the keyboard.
bool ScrollResponder::handleStartShouldSetResponder(const srx::PressEvent &e) const {
  if (props_.disableScrollViewPanResponder)
    return false;
  const auto focused = svc_.textInput.currentlyFocusedField();
  return effectivePersistTaps(props_) == KeyboardPersistTaps::Handled && focused &&
         e.target != focused;
}

// Capture phase: claim the touch ahead of descendants when
//  - the surface is still moving (the tap stops it), or
//  - the keyboard is up under "never" and the tap lands outside any text input
//    (first tap dismisses the keyboard, the second reaches the child).
bool ScrollResponder::handleStartShouldSetResponderCapture(const srx::PressEvent &e) const {
  if (props_.disableScrollViewPanResponder)
    return false;
  if (isAnimating())
    return true;

  const auto focused = svc_.textInput.currentlyFocusedField();
  return effectivePersistTaps(props_) == KeyboardPersistTaps::Never && focused && e.target &&
         !svc_.textInput.isTextInput(*e.target);
}

// Once a touch has begun on the native surface it cannot be disabled, so a
// refusal from the current responder is simply waited out.
void ScrollResponder::handleResponderReject() {}

// Yield to an outer gesture (back-swipe, pull-to-dismiss) only while this
// acquisition has not moved the content.
bool ScrollResponder::handleTerminationRequest() const {
  return !state_.observedScrollSinceBecomingResponder();
}

void ScrollResponder::handleResponderGrant(const srx::PressEvent &e) {
  state_.becomeResponder();
  notifyHost(props_.onResponderGrant, e);
  // after the host callback, which may itself touch momentum state
  state_.latchAnimating(svc_.clock.nowMs());
}

void ScrollResponder::handleResponderRelease(const srx::PressEvent &e) {
  notifyHost(props_.onResponderRelease, e);

  // a tap outside the focused input dismisses the keyboard; scrolling, stopping
  // a moving surface or tapping the input itself does not
  const auto focused = svc_.textInput.currentlyFocusedField();
  if (effectivePersistTaps(props_) != KeyboardPersistTaps::Always && focused &&
      e.target != focused && !state_.observedScrollSinceBecomingResponder() &&
      !state_.becameResponderWhileAnimating()) {
    notifyHost(props_.onScrollResponderKeyboardDismissed, e);
    svc_.textInput.blurTextInput(*focused);
  }
}

// --- touches ---

void ScrollResponder::handleTouchStart(const srx::PressEvent &e) {
  state_.touchStart();
  notifyHost(props_.onTouchStart, e);
}

void ScrollResponder::handleTouchMove(const srx::PressEvent &e) { notifyHost(props_.onTouchMove, e); }

void ScrollResponder::handleTouchEnd(const srx::PressEvent &e) {
  state_.touchEnd(e.touches);
  notifyHost(props_.onTouchEnd, e);
}

void ScrollResponder::handleTouchCancel(const srx::PressEvent &e) {
  state_.touchCancel();
  notifyHost(props_.onTouchCancel, e);
}

// --- scrolling ---

void ScrollResponder::handleScroll(const srx::ScrollEvent &e) {
  state_.observeScroll();
  notifyHost(props_.onScroll, e);
}

// Also fires when a finger stops a running animation; there is no reliable way
// to tell that apart from a real drag here.
void ScrollResponder::handleScrollBeginDrag(const srx::ScrollEvent &e) {
  svc_.tracker.beginScroll();
  notifyHost(props_.onScrollBeginDrag, e);
}

void ScrollResponder::handleScrollEndDrag(const srx::ScrollEvent &e) {
  // While animating this drag only stopped the surface and momentum end will
  // close the interaction. Non-zero velocity means momentum follows. Without
  // velocity, ending twice beats never ending.
  if (!isAnimating() && (!e.velocity || srx::isZero(*e.velocity)))
    svc_.tracker.endScroll();
  notifyHost(props_.onScrollEndDrag, e);
}

void ScrollResponder::handleMomentumScrollBegin(const srx::ScrollEvent &e) {
  state_.momentumBegin(svc_.clock.nowMs());
  notifyHost(props_.onMomentumScrollBegin, e);
}

void ScrollResponder::handleMomentumScrollEnd(const srx::ScrollEvent &e) {
  svc_.tracker.endScroll();
  state_.momentumEnd(svc_.clock.nowMs());
  notifyHost(props_.onMomentumScrollEnd, e);
}

// --- keyboard ---

void ScrollResponder::handleKeyboardWillShow(const std::optional<srx::KeyboardEvent> &e) {
  keyboardWillOpenTo_ = e;
  notifyHost(props_.onKeyboardWillShow, e);
}

void ScrollResponder::handleKeyboardWillHide(const std::optional<srx::KeyboardEvent> &e) {
  keyboardWillOpenTo_.reset();
  notifyHost(props_.onKeyboardWillHide, e);
}

void ScrollResponder::handleKeyboardDidShow(const std::optional<srx::KeyboardEvent> &e) {
  // some platforms send didShow without a payload; keep the willShow frame then
  if (e)
    keyboardWillOpenTo_ = e;
  notifyHost(props_.onKeyboardDidShow, e);
}

void ScrollResponder::handleKeyboardDidHide(const std::optional<srx::KeyboardEvent> &e) {
  keyboardWillOpenTo_.reset();
  notifyHost(props_.onKeyboardDidHide, e);
}

// --- commands ---

srx::NodeHandle ScrollResponder::requireScrollableNode(const char *command) const {
  if (!nodes_.scrollable)
    throw std::logic_error(std::string(command) + ": scroll view has no scrollable node");
  return *nodes_.scrollable;
}

void ScrollResponder::scrollTo(const ScrollToOptions &opts) {
  const srx::NodeHandle node = requireScrollableNode(commands::kScrollTo);
  svc_.commands.dispatchCommand(node, commands::kScrollTo,
                                {double(opts.x.value_or(0.f)), double(opts.y.value_or(0.f)),
                                 opts.animated.value_or(true)});
}

void ScrollResponder::scrollTo(float x, float y, bool animated) {
  svc_.log.warn("`scrollTo(x, y, animated)` is deprecated. "
                "Use `scrollTo({x: 5, y: 5, animated: true})` instead.");
  scrollTo(ScrollToOptions{x, y, animated});
}

void ScrollResponder::scrollToEnd(const ScrollToEndOptions &opts) {
  const srx::NodeHandle node = requireScrollableNode(commands::kScrollToEnd);
  svc_.commands.dispatchCommand(node, commands::kScrollToEnd, {opts.animated.value_or(true)});
}

void ScrollResponder::zoomToRect(ZoomRect rect, std::optional<bool> animated) {
  if (!svc_.platform.supportsZoom())
    throw std::logic_error("zoomToRect is not implemented");
  if (rect.animated) {
    animated = rect.animated;
  } else if (animated) {
    svc_.log.warn("`zoomToRect` `animated` argument is deprecated. Use `options.animated` instead");
  }
  if (!nodes_.nativeScrollRef)
    throw std::logic_error("Expected zoomToRect to be called on a scroll view with a native "
                           "scroll handle");
  svc_.commands.dispatchCommand(*nodes_.nativeScrollRef, commands::kZoomToRect,
                                {srx::rect{rect.x, rect.y, rect.width, rect.height},
                                 animated.value_or(true)});
}

void ScrollResponder::flashScrollIndicators() {
  const srx::NodeHandle node = requireScrollableNode(commands::kFlashScrollIndicators);
  svc_.commands.dispatchCommand(node, commands::kFlashScrollIndicators, {});
}

void ScrollResponder::scrollNativeHandleToKeyboard(srx::NodeHandle target, float additionalOffset,
                                                   bool preventNegativeOffset) {
  additionalScrollOffset_ = additionalOffset;
  preventNegativeScrollOffset_ = preventNegativeOffset;

  if (!nodes_.innerView) {
    textInputFocusError("scroll view has no inner view node");
    return;
  }

  std::weak_ptr<ScrollResponder *> weak = self_;
  svc_.commands.measureLayout(
      target, *nodes_.innerView,
      [weak](const std::string &msg) {
        if (auto self = weak.lock())
          (*self)->textInputFocusError(msg);
      },
      [weak](float left, float top, float width, float height) {
        if (auto self = weak.lock())
          (*self)->inputMeasureAndScrollToKeyboard(left, top, width, height);
      });
}

// Assumes the scroll view covers the whole screen. The keyboard frame is read
// now, not when the measurement was requested: a hide in between falls back to
// the window height.
void ScrollResponder::inputMeasureAndScrollToKeyboard(float, float top, float, float height) {
  float keyboardScreenY = svc_.platform.windowHeight();
  if (keyboardWillOpenTo_)
    keyboardScreenY = keyboardWillOpenTo_->endCoordinates.screenY;

  float scrollOffsetY = top - keyboardScreenY + height + additionalScrollOffset_;
  // negative offsets pull the content down to meet the keyboard; optional
  if (preventNegativeScrollOffset_)
    scrollOffsetY = std::max(0.f, scrollOffsetY);
  scrollTo(ScrollToOptions{0.f, scrollOffsetY, true});

  additionalScrollOffset_ = 0.f;
  preventNegativeScrollOffset_ = false;
}

void ScrollResponder::textInputFocusError(const std::string &msg) {
  svc_.log.error("Error measuring text field: " + msg);
  additionalScrollOffset_ = 0.f;
  preventNegativeScrollOffset_ = false;
}
