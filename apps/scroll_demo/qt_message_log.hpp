#pragma once
#include "responder_log.hpp"

// Routes responder diagnostics into Qt's message handler.
class QtMessageLog : public ResponderLog {
public:
  void debug(const std::string &msg) override;
  void warn(const std::string &msg) override;
  void error(const std::string &msg) override;
};
