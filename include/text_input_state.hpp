#pragma once
#include "events.hpp"
#include <functional>
#include <optional>
#include <unordered_set>

class TextInputFocus {
public:
  virtual ~TextInputFocus() = default;
  virtual std::optional<srx::NodeHandle> currentlyFocusedField() const = 0;
  virtual bool isTextInput(srx::NodeHandle target) const = 0;
  virtual void blurTextInput(srx::NodeHandle field) = 0;
};

// Tracks which registered text input currently holds focus.
class TextInputState : public TextInputFocus {
public:
  using Hook = std::function<void(srx::NodeHandle)>;

  void registerInput(srx::NodeHandle h);
  void unregisterInput(srx::NodeHandle h);
  // forget every input, e.g. when the host swaps its content; no hooks run
  void unregisterAll();

  // false if h is not a registered input
  bool focusTextInput(srx::NodeHandle h);
  // no-op unless field is the focused one
  void blurTextInput(srx::NodeHandle field) override;

  std::optional<srx::NodeHandle> currentlyFocusedField() const override { return focused_; }
  bool isTextInput(srx::NodeHandle target) const override;

  // called after focus moves / is cleared, so the host can drive native focus
  void setFocusHook(Hook h) { onFocus_ = std::move(h); }
  void setBlurHook(Hook h) { onBlur_ = std::move(h); }

private:
  std::unordered_set<srx::NodeHandle> inputs_;
  std::optional<srx::NodeHandle> focused_;
  Hook onFocus_, onBlur_;
};
