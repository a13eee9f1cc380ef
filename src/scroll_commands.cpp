#include "scroll_commands.hpp"
#include <sstream>

namespace {
struct ArgFormatter {
  std::ostream &os;
  void operator()(double d) const { os << d; }
  void operator()(bool b) const { os << (b ? "true" : "false"); }
  void operator()(const srx::rect &r) const {
    os << '{' << r.x << ',' << r.y << ',' << r.width << ',' << r.height << '}';
  }
};
}

std::string formatArg(const CommandArg &a) {
  std::ostringstream os;
  std::visit(ArgFormatter{os}, a);
  return os.str();
}

std::string formatCommand(srx::NodeHandle target, const std::string &name, const CommandArgs &args) {
  std::ostringstream os;
  os << name << '@' << target << '(';
  for (size_t i = 0; i < args.size(); ++i) {
    if (i)
      os << ", ";
    std::visit(ArgFormatter{os}, args[i]);
  }
  os << ')';
  return os.str();
}
