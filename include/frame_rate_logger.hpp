#pragma once
#include <string>

class ResponderLog;

// Fire-and-forget scroll interaction bookkeeping. Redundant calls are tolerated.
class InteractionTracker {
public:
  virtual ~InteractionTracker() = default;
  virtual void beginScroll() = 0;
  virtual void endScroll() = 0;
};

class FrameRateLogger : public InteractionTracker {
public:
  struct Options {
    bool debug = false;
  };

  explicit FrameRateLogger(ResponderLog *log = nullptr);

  void setGlobalOptions(const Options &o) { opts_ = o; }
  void setContext(const std::string &ctx) { context_ = ctx; }

  void beginScroll() override;
  void endScroll() override;

  bool inScrollInteraction() const { return active_; }
  int begunCount() const { return begun_; }
  int endedCount() const { return ended_; }
  int redundantEnds() const { return redundant_; }

private:
  ResponderLog *log_;
  Options opts_;
  std::string context_;
  bool active_ = false;
  int begun_ = 0, ended_ = 0, redundant_ = 0;

  void trace(const char *what);
};
