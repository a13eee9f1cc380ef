#pragma once
#include "events.hpp"
#include <functional>
#include <string>
#include <variant>
#include <vector>

using CommandArg = std::variant<double, bool, srx::rect>;
using CommandArgs = std::vector<CommandArg>;

namespace commands {
constexpr const char *kScrollTo = "scrollTo";
constexpr const char *kScrollToEnd = "scrollToEnd";
constexpr const char *kZoomToRect = "zoomToRect";
constexpr const char *kFlashScrollIndicators = "flashScrollIndicators";
} // namespace commands

// Outbound side of the native scroll surface.
class ScrollCommandSink {
public:
  using MeasureError = std::function<void(const std::string &)>;
  using MeasureSuccess = std::function<void(float left, float top, float width, float height)>;

  virtual ~ScrollCommandSink() = default;
  virtual void dispatchCommand(srx::NodeHandle target, const std::string &name,
                               const CommandArgs &args) = 0;
  // Exactly one of the callbacks runs, possibly after this call returns.
  virtual void measureLayout(srx::NodeHandle target, srx::NodeHandle relativeTo,
                             MeasureError onError, MeasureSuccess onSuccess) = 0;
};

class PlatformInfo {
public:
  virtual ~PlatformInfo() = default;
  virtual bool supportsZoom() const = 0;
  virtual float windowHeight() const = 0;
};

class FixedPlatform : public PlatformInfo {
public:
  FixedPlatform(bool zoom, float windowHeight) : zoom_(zoom), h_(windowHeight) {}
  bool supportsZoom() const override { return zoom_; }
  float windowHeight() const override { return h_; }

private:
  bool zoom_;
  float h_;
};

std::string formatArg(const CommandArg &a);
std::string formatCommand(srx::NodeHandle target, const std::string &name, const CommandArgs &args);
