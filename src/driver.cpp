#include <tsim/driver.hpp>
#include <spdlog/spdlog.h>
#include <tsim/errors.hpp>
#include <tsim/overloaded.hpp>
#include <tsim/savestate.hpp>

namespace tsim {

const char* to_string(StopReason r) {
  switch (r) {
    case StopReason::Completed: return "completed";
    case StopReason::Halted:    return "halted";
  }
  return "unknown";
}

static bool crossed(Clock prev, Clock now, Clock mark) {
  return prev < mark && mark <= now;
}

// Evaluates one condition after a step from `prev` to sim.time().
static bool check(const HaltCondition& cond, const TrafficSim& sim, const Map& map,
                  Clock prev, RunOutcome& outcome) {
  const Clock now = sim.time();
  return std::visit(overloaded{
    [&](const TimeBound& c) { return now >= c.limit; },
    [&](const Always&) { return true; },
    [&](const SaveAt& c) {
      if (!crossed(prev, now, c.at)) return false;
      outcome.saved.push_back(save(map, sim));
      return c.stop;
    },
    [&](const SaveEvery& c) {
      if (prev.ticks() / c.period.ticks() != now.ticks() / c.period.ticks()) {
        outcome.saved.push_back(save(map, sim));
      }
      return false;
    },
    [&](const Custom& c) {
      const bool stop = c.should_stop && c.should_stop(sim);
      if (stop) spdlog::info("halt condition '{}' fired at {}", c.label, now.format());
      return stop;
    },
  }, cond);
}

RunOutcome run_until_done(TrafficSim& sim, const Map& map,
                          const std::vector<HaltCondition>& conditions, Timer& timer) {
  const Duration step = sim.options().step;
  if (step <= Duration::zero()) throw ConfigError("step must be positive");
  for (const auto& c : conditions) {
    const auto* every = std::get_if<SaveEvery>(&c);
    if (every && every->period <= Duration::zero()) {
      throw ConfigError("SaveEvery needs a positive period, got " + every->period.to_string());
    }
  }

  timer.start("run until done");
  RunOutcome outcome;
  const Duration report_every = Duration::hours(1);
  std::int64_t last_report = sim.time().ticks() / report_every.ticks();

  while (!sim.is_done()) {
    const Clock prev = sim.time();
    sim.step(map, step);

    bool stop = false;
    for (const auto& c : conditions) {
      if (check(c, sim, map, prev, outcome)) stop = true;
    }

    const std::int64_t hour = sim.time().ticks() / report_every.ticks();
    if (hour != last_report) {
      last_report = hour;
      spdlog::info("{}: {} finished, {} travelling, {} waiting to depart", sim.time().format(),
                   sim.finished_trips().size(), sim.active_trips(), sim.pending_trips());
    }
    if (stop) {
      outcome.reason = StopReason::Halted;
      break;
    }
  }

  outcome.end_time = sim.time();
  timer.stop("run until done");
  spdlog::info("run {} {} at {}", sim.options().run_name, to_string(outcome.reason),
               outcome.end_time.format());
  return outcome;
}

} // namespace tsim
