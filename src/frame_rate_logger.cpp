#include "frame_rate_logger.hpp"
#include "responder_log.hpp"

FrameRateLogger::FrameRateLogger(ResponderLog *log) : log_(log) {}

void FrameRateLogger::beginScroll() {
  // a second begin without an end restarts the same interaction
  if (active_) {
    trace("scroll interaction restarted");
    return;
  }
  active_ = true;
  ++begun_;
  trace("scroll interaction began");
}

void FrameRateLogger::endScroll() {
  if (!active_) {
    ++redundant_;
    return;
  }
  active_ = false;
  ++ended_;
  trace("scroll interaction ended");
}

void FrameRateLogger::trace(const char *what) {
  if (!opts_.debug || !log_)
    return;
  std::string msg = what;
  if (!context_.empty())
    msg += " (" + context_ + ")";
  log_->debug(msg);
}
