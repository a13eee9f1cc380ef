#include "text_input_state.hpp"

void TextInputState::registerInput(srx::NodeHandle h) { inputs_.insert(h); }

void TextInputState::unregisterInput(srx::NodeHandle h) {
  inputs_.erase(h);
  if (focused_ && *focused_ == h)
    focused_.reset();
}

void TextInputState::unregisterAll() {
  inputs_.clear();
  focused_.reset();
}

bool TextInputState::focusTextInput(srx::NodeHandle h) {
  if (!isTextInput(h))
    return false;
  if (focused_ && *focused_ == h)
    return true;
  focused_ = h;
  if (onFocus_)
    onFocus_(h);
  return true;
}

void TextInputState::blurTextInput(srx::NodeHandle field) {
  if (!focused_ || *focused_ != field)
    return;
  focused_.reset();
  if (onBlur_)
    onBlur_(field);
}

bool TextInputState::isTextInput(srx::NodeHandle target) const {
  return inputs_.count(target) != 0;
}
