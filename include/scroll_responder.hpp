#pragma once
#include "clock.hpp"
#include "events.hpp"
#include "frame_rate_logger.hpp"
#include "keyboard.hpp"
#include "responder_log.hpp"
#include "responder_state.hpp"
#include "scroll_commands.hpp"
#include "scroll_props.hpp"
#include "text_input_state.hpp"
#include <memory>
#include <optional>
#include <string>

// Native nodes the host surface exposes to the responder.
struct ScrollNodes {
  std::optional<srx::NodeHandle> scrollable;      // target of scroll commands
  std::optional<srx::NodeHandle> innerView;       // content node, measuring reference
  std::optional<srx::NodeHandle> nativeScrollRef; // zoom target
};

// Collaborators are borrowed; they must outlive the responder.
struct ResponderServices {
  TextInputFocus &textInput;
  InteractionTracker &tracker;
  KeyboardBroadcaster &keyboard;
  ScrollCommandSink &commands;
  const PlatformInfo &platform;
  const Clock &clock;
  ResponderLog &log;
};

struct ScrollToOptions {
  std::optional<float> x, y;
  std::optional<bool> animated;
};

struct ScrollToEndOptions {
  std::optional<bool> animated;
};

struct ZoomRect {
  float x{}, y{}, width{}, height{};
  std::optional<bool> animated;
};

// Decides who owns a gesture on a scrollable surface and coordinates it with
// the software keyboard. Embedded in the host surface, which calls the
// handle* entry points from its event dispatch.
//
// iOS timing, scrolling without bounce, finger goes down:
//   momentumBegin, touchStart (capture, then bubble), responderRelease, momentumEnd
// with bounce:
//   momentumBegin, ... bounce ..., momentumEnd, touchStart, touchEnd, momentumBegin
// In the second order momentumEnd arrives *before* the touch that stopped the
// motion; isAnimating() covers it with a short window after momentumEnd.
//
// Keyboard events are received here and then passed to the props callbacks, so
// a host reacting to onKeyboardWillShow always sees the updated keyboard frame.
class ScrollResponder {
public:
  ScrollResponder(const ScrollProps &props, const ScrollNodes &nodes, ResponderServices services,
                  double animatingThresholdMs = ResponderState::kDefaultAnimatingThresholdMs);
  ~ScrollResponder();
  ScrollResponder(const ScrollResponder &) = delete;
  ScrollResponder &operator=(const ScrollResponder &) = delete;

  // subscribe to / release the four keyboard notifications
  void attach();
  void detach();
  bool attached() const { return attached_; }

  void setNodes(const ScrollNodes &n) { nodes_ = n; }
  std::optional<srx::NodeHandle> scrollableNode() const { return nodes_.scrollable; }

  // responder negotiation
  bool handleScrollShouldSetResponder() const;
  bool handleStartShouldSetResponder(const srx::PressEvent &e) const;
  bool handleStartShouldSetResponderCapture(const srx::PressEvent &e) const;
  void handleResponderReject();
  bool handleTerminationRequest() const;
  void handleResponderGrant(const srx::PressEvent &e);
  void handleResponderRelease(const srx::PressEvent &e);

  // touches
  void handleTouchStart(const srx::PressEvent &e);
  void handleTouchMove(const srx::PressEvent &e);
  void handleTouchEnd(const srx::PressEvent &e);
  void handleTouchCancel(const srx::PressEvent &e);

  // scrolling
  void handleScroll(const srx::ScrollEvent &e);
  void handleScrollBeginDrag(const srx::ScrollEvent &e);
  void handleScrollEndDrag(const srx::ScrollEvent &e);
  void handleMomentumScrollBegin(const srx::ScrollEvent &e);
  void handleMomentumScrollEnd(const srx::ScrollEvent &e);

  // keyboard; may fire several times per transition
  void handleKeyboardWillShow(const std::optional<srx::KeyboardEvent> &e);
  void handleKeyboardWillHide(const std::optional<srx::KeyboardEvent> &e);
  void handleKeyboardDidShow(const std::optional<srx::KeyboardEvent> &e);
  void handleKeyboardDidHide(const std::optional<srx::KeyboardEvent> &e);

  bool isAnimating() const;

  void scrollTo(const ScrollToOptions &opts = {});
  // deprecated positional form
  void scrollTo(float x, float y, bool animated = true);
  void scrollToEnd(const ScrollToEndOptions &opts = {});
  void zoomToRect(ZoomRect rect, std::optional<bool> animated = std::nullopt);
  void flashScrollIndicators();

  // Scrolls so that target's bottom edge sits on the keyboard's top edge
  // (plus additionalOffset). Completes after an asynchronous measurement.
  void scrollNativeHandleToKeyboard(srx::NodeHandle target, float additionalOffset = 0.f,
                                    bool preventNegativeOffset = false);

  const ResponderState &state() const { return state_; }
  const std::optional<srx::KeyboardEvent> &keyboardWillOpenTo() const { return keyboardWillOpenTo_; }

private:
  const ScrollProps &props_;
  ScrollNodes nodes_;
  ResponderServices svc_;
  ResponderState state_;

  std::optional<srx::KeyboardEvent> keyboardWillOpenTo_;
  float additionalScrollOffset_ = 0.f;
  bool preventNegativeScrollOffset_ = false;

  bool attached_ = false;
  Subscription subWillShow_, subWillHide_, subDidShow_, subDidHide_;
  // pending measurements hold a weak reference so a late completion is dropped
  std::shared_ptr<ScrollResponder *> self_;

  srx::NodeHandle requireScrollableNode(const char *command) const;
  void inputMeasureAndScrollToKeyboard(float left, float top, float width, float height);
  void textInputFocusError(const std::string &msg);
};
