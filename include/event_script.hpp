#pragma once
#include <istream>
#include <map>
#include <string>
#include <vector>

// One timestamped line of a script: "<ms> <name> [key=value ...]"
struct ScriptEvent {
  double timeMs = 0.0;
  std::string name;
  std::map<std::string, std::string> args;
  int line = 0;

  bool has(const std::string &key) const { return args.count(key) != 0; }
  // false when the key is absent or its value is malformed; number() also
  // rejects nan and inf
  bool number(const std::string &key, double &out) const;
  bool integer(const std::string &key, int &out) const;
  bool flag(const std::string &key, bool fallback) const;
};

class EventScript {
public:
  std::vector<ScriptEvent> events;
  std::string error; // set when load/parse fail, "line N: ..."

  bool load(const std::string &path);
  bool parse(std::istream &is);
};
