#pragma once
class ResponderState {
public:
    // Bridges the gap between a native momentum-end and the touch-start of the
    // finger that stopped it. Empirical; recalibrate per platform event latency.
    static constexpr double kDefaultAnimatingThresholdMs = 16.0;

    explicit ResponderState(double animatingThresholdMs = kDefaultAnimatingThresholdMs);

    void touchStart();
    void touchEnd(int remainingTouches);
    void touchCancel();
    void becomeResponder();
    void latchAnimating(double nowMs);
    void observeScroll();
    void momentumBegin(double nowMs);
    void momentumEnd(double nowMs);

    bool isAnimating(double nowMs) const;

    bool isTouching() const { return touching_; }
    double lastMomentumScrollBeginTime() const { return momBegin_; }
    double lastMomentumScrollEndTime() const { return momEnd_; }
    bool observedScrollSinceBecomingResponder() const { return observedScroll_; }
    bool becameResponderWhileAnimating() const { return grantedWhileAnimating_; }
    double animatingThresholdMs() const { return thresholdMs_; }
private:
    double thresholdMs_;
    bool touching_;
    double momBegin_, momEnd_;
    bool observedScroll_, grantedWhileAnimating_;
};
