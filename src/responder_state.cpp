#include "responder_state.hpp"

ResponderState::ResponderState(double animatingThresholdMs)
    : thresholdMs_(animatingThresholdMs), touching_(false), momBegin_(0.0), momEnd_(0.0),
      observedScroll_(false), grantedWhileAnimating_(false) {}

void ResponderState::touchStart() { touching_ = true; }
void ResponderState::touchEnd(int remainingTouches) { touching_ = remainingTouches != 0; }
void ResponderState::touchCancel() { touching_ = false; }

// stale flags from the previous grant cycle must not survive a new grant
void ResponderState::becomeResponder() { observedScroll_ = false; }
void ResponderState::latchAnimating(double nowMs) { grantedWhileAnimating_ = isAnimating(nowMs); }

void ResponderState::observeScroll() { observedScroll_ = true; }
void ResponderState::momentumBegin(double nowMs) { momBegin_ = nowMs; }
void ResponderState::momentumEnd(double nowMs) { momEnd_ = nowMs; }

// Native momentum notifications interleave with touches in platform order, so
// "animating" is derived from the two timestamps instead of being tracked:
// either momentum ended a moment ago, or a begin has no matching end yet.
bool ResponderState::isAnimating(double nowMs) const {
    const double sinceEnd = nowMs - momEnd_;
    return sinceEnd < thresholdMs_ || momEnd_ < momBegin_;
}
