#pragma once
#include <functional>
#include <string>
#include <variant>
#include <vector>
#include <tsim/clock.hpp>
#include <tsim/sim.hpp>
#include <tsim/timer.hpp>

namespace tsim {

// Stop once the clock reaches `limit`.
struct TimeBound { Clock limit; };
// Stop after the first step.
struct Always {};
// Save when the clock passes `at`; optionally stop right after.
struct SaveAt { Clock at; bool stop = true; };
// Save every time the clock passes a multiple of `period`.
struct SaveEvery { Duration period; };
// Arbitrary check; return true to stop.
struct Custom {
  std::string label;
  std::function<bool(const TrafficSim&)> should_stop;
};

using HaltCondition = std::variant<TimeBound, Always, SaveAt, SaveEvery, Custom>;

enum class StopReason : int { Completed = 0, Halted = 1 };
const char* to_string(StopReason r);

struct RunOutcome {
  Clock end_time;
  StopReason reason = StopReason::Completed;
  std::vector<std::string> saved;   // savestate paths, in order written
};

// Steps `sim` by its configured step until it is done or a condition asks to
// stop. Conditions are checked in order after every step, always all of
// them, and only ever see fully committed state. There is no built-in time
// limit: with endless demand, pass a TimeBound. PersistenceError from a save
// propagates.
RunOutcome run_until_done(TrafficSim& sim, const Map& map,
                          const std::vector<HaltCondition>& conditions, Timer& timer);

} // namespace tsim
