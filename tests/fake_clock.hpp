#pragma once
#include <chrono>
#include "undo_manager.hpp"

/*manually advanced time source for grouping/idle tests*/
struct FakeClock {
  HistoryClock::time_point now{};
  void advance(int ms) { now += std::chrono::milliseconds(ms); }
  ClockFn fn() { return [this] { return now; }; }
};
