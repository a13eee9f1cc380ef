#include "clock.hpp"
#include <chrono>

static double steadyNs() {
  using namespace std::chrono;
  return double(duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count());
}

// origin is taken at construction so values stay small
SteadyClock::SteadyClock(double startMs) : originNs_(steadyNs() - startMs * 1.0e6) {}

double SteadyClock::nowMs() const { return (steadyNs() - originNs_) / 1.0e6; }
