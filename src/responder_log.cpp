#include "responder_log.hpp"
#include <iostream>

StderrLog::StderrLog() : os_(std::cerr), verbose_(false) {}
StderrLog::StderrLog(std::ostream &os, bool verbose) : os_(os), verbose_(verbose) {}

void StderrLog::debug(const std::string &msg) {
  if (!verbose_)
    return;
  os_ << "[debug] " << msg << '\n';
}

void StderrLog::warn(const std::string &msg) { os_ << "[warn] " << msg << '\n'; }

void StderrLog::error(const std::string &msg) {
  os_ << "[error] " << msg << '\n';
  os_.flush();
}
