#pragma once
#include "clock.hpp"
#include "event_script.hpp"
#include "frame_rate_logger.hpp"
#include "keyboard.hpp"
#include "scroll_commands.hpp"
#include "scroll_props.hpp"
#include "scroll_responder.hpp"
#include "text_input_state.hpp"
#include <functional>
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

// Command sink of a replayed surface: records commands and answers layout
// queries from a table. Measurements complete on flushPending(), not inline.
class ReplayCommandSink : public ScrollCommandSink {
public:
  void setLayout(srx::NodeHandle node, const srx::rect &r) { layouts_[node] = r; }
  void setListener(std::function<void(const std::string &)> fn) { listener_ = std::move(fn); }

  void dispatchCommand(srx::NodeHandle target, const std::string &name,
                       const CommandArgs &args) override;
  void measureLayout(srx::NodeHandle target, srx::NodeHandle relativeTo, MeasureError onError,
                     MeasureSuccess onSuccess) override;

  size_t flushPending();
  const std::vector<std::string> &issued() const { return issued_; }

private:
  std::map<srx::NodeHandle, srx::rect> layouts_;
  std::vector<std::function<void()>> pending_;
  std::vector<std::string> issued_;
  std::function<void(const std::string &)> listener_;
};

struct ReplayOptions {
  double animatingThresholdMs = ResponderState::kDefaultAnimatingThresholdMs;
  float windowHeight = 800.f;
  bool zoomSupported = false;
  KeyboardPersistTaps persistTaps = KeyboardPersistTaps::Never;
  bool disablePanResponder = false;
  bool traceInteractions = false; // FrameRateLogger debug output
};

// Feeds an EventScript through a ScrollResponder and writes one line per
// observable effect to `out`.
class ScriptPlayer {
public:
  static constexpr srx::NodeHandle kScrollableNode = 1;
  static constexpr srx::NodeHandle kInnerViewNode = 2;
  static constexpr srx::NodeHandle kNativeScrollRef = 3;

  ScriptPlayer(std::ostream &out, ResponderLog &log, const ReplayOptions &opts = {});
  ~ScriptPlayer();

  bool play(const EventScript &script);
  const std::string &error() const { return error_; }

  const ScrollResponder &responder() const { return *responder_; }
  const ReplayCommandSink &sink() const { return sink_; }
  const FrameRateLogger &frameRateLogger() const { return tracker_; }
  const TextInputState &textInputs() const { return inputs_; }

private:
  std::ostream &out_;
  ResponderLog &log_;
  ReplayOptions opts_;
  // script time t runs at epochMs_ + t on the responder's clock
  double epochMs_;
  double scriptMs_ = 0.0;
  ManualClock clock_;
  KeyboardEmitter keyboard_;
  TextInputState inputs_;
  FrameRateLogger tracker_;
  ReplayCommandSink sink_;
  FixedPlatform platform_;
  ScrollProps props_;
  std::unique_ptr<ScrollResponder> responder_;
  std::string error_;

  void installHostCallbacks();
  bool step(const ScriptEvent &ev);
  void report(const std::string &what);
};
