#pragma once
#include "geom.hpp"
#include <optional>

namespace srx {

// Opaque identifier of a native view (surface, inner content node, text input).
using NodeHandle = int;

struct PressEvent {
  std::optional<NodeHandle> target;
  int touches = 0; // touch points still down once this event is applied
  vec2 location{};
};

struct ScrollEvent {
  std::optional<NodeHandle> target;
  vec2 contentOffset{};
  std::optional<vec2> velocity; // px/ms, only on drag end
};

struct KeyboardCoordinates {
  float screenX{}, screenY{}, width{}, height{};
};

struct KeyboardEvent {
  std::optional<KeyboardCoordinates> startCoordinates;
  KeyboardCoordinates endCoordinates;
  double duration = 0.0;
};

enum class KeyboardEventType { WillShow, DidShow, WillHide, DidHide };

} // namespace srx
