#pragma once
#include <ostream>
#include <string>

class ResponderLog {
public:
  virtual ~ResponderLog() = default;
  virtual void debug(const std::string &msg) = 0;
  virtual void warn(const std::string &msg) = 0;
  virtual void error(const std::string &msg) = 0;
};

// Level-prefixed lines on an ostream (std::cerr unless told otherwise).
class StderrLog : public ResponderLog {
public:
  StderrLog();
  explicit StderrLog(std::ostream &os, bool verbose = false);

  void setVerbose(bool v) { verbose_ = v; }

  void debug(const std::string &msg) override;
  void warn(const std::string &msg) override;
  void error(const std::string &msg) override;

private:
  std::ostream &os_;
  bool verbose_;
};
