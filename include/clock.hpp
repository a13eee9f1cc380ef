#pragma once

// Monotonic time source in milliseconds.
class Clock {
public:
  virtual ~Clock() = default;
  virtual double nowMs() const = 0;
};

// Reads `startMs` at construction. Start at or past the animating threshold so
// the zeroed momentum timestamps do not read as a momentum end just now.
class SteadyClock : public Clock {
public:
  explicit SteadyClock(double startMs = 0.0);
  double nowMs() const override;

private:
  double originNs_;
};

// Clock that only moves when told to (tests, script replay).
class ManualClock : public Clock {
public:
  explicit ManualClock(double startMs = 0.0) : now_(startMs) {}
  double nowMs() const override { return now_; }
  void setNowMs(double ms) { now_ = ms; }
  void advance(double ms) { now_ += ms; }

private:
  double now_;
};
