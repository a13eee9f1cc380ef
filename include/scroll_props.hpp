#pragma once
#include "events.hpp"
#include <functional>
#include <optional>
#include <variant>

enum class KeyboardPersistTaps { Never, Always, Handled };

using PressCallback = std::function<void(const srx::PressEvent &)>;
using ScrollCallback = std::function<void(const srx::ScrollEvent &)>;
using KeyboardCallback = std::function<void(const std::optional<srx::KeyboardEvent> &)>;

// Host configuration. Read by the responder, never written.
struct ScrollProps {
  // bool is the deprecated spelling: true == Always, false == Never
  std::variant<KeyboardPersistTaps, bool> keyboardShouldPersistTaps = KeyboardPersistTaps::Never;
  bool disableScrollViewPanResponder = false;

  PressCallback onTouchStart, onTouchMove, onTouchEnd, onTouchCancel;
  PressCallback onResponderGrant, onResponderRelease;
  PressCallback onScrollResponderKeyboardDismissed;

  ScrollCallback onScroll;
  ScrollCallback onScrollBeginDrag, onScrollEndDrag;
  ScrollCallback onMomentumScrollBegin, onMomentumScrollEnd;

  KeyboardCallback onKeyboardWillShow, onKeyboardDidShow;
  KeyboardCallback onKeyboardWillHide, onKeyboardDidHide;
};

inline bool persistTapsIsLegacy(const ScrollProps &p) {
  return std::holds_alternative<bool>(p.keyboardShouldPersistTaps);
}

inline KeyboardPersistTaps effectivePersistTaps(const ScrollProps &p) {
  if (const bool *b = std::get_if<bool>(&p.keyboardShouldPersistTaps))
    return *b ? KeyboardPersistTaps::Always : KeyboardPersistTaps::Never;
  return std::get<KeyboardPersistTaps>(p.keyboardShouldPersistTaps);
}

inline const char *toString(KeyboardPersistTaps t) {
  switch (t) {
  case KeyboardPersistTaps::Never:
    return "never";
  case KeyboardPersistTaps::Always:
    return "always";
  case KeyboardPersistTaps::Handled:
    return "handled";
  }
  return "never";
}

// Invokes cb only if the host supplied it.
template <class Fn, class Arg> inline void notifyHost(const Fn &cb, const Arg &arg) {
  if (cb)
    cb(arg);
}
