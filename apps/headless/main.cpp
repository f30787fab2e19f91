#include <iostream>
#include <spdlog/spdlog.h>
#include <tsim/cli.hpp>
#include <tsim/driver.hpp>
#include <tsim/errors.hpp>
#include <tsim/log.hpp>
#include <tsim/spawner.hpp>
#include <tsim/stats.hpp>

using namespace tsim;

static void report(const TrafficSim& sim) {
  for (const auto& [mode, s] : from_ledger(sim.finished_trips())) {
    spdlog::info("{:>8}: {} trips, median {}, p90 {}, max {}", to_string(mode), s.count,
                 s.p50.to_string(), s.p90.to_string(), s.max.to_string());
  }
  for (const auto& [route, s] : bus_route_stats(sim.bus_legs())) {
    spdlog::info("route {}: {} legs, {} between stops on average", route, s.count, s.mean.to_string());
  }
  spdlog::info("{} aborted, badness {}", sim.aborted_trips(), sim.badness().to_string());
}

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  HeadlessArgs a;
  try {
    a = parse_headless_args(args);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n" << headless_usage();
    return 2;
  }
  init_logging("tsim_headless", a.verbose);

  try {
    if (a.edits_path) a.flags.edits = read_edits_file(*a.edits_path);

    Timer timer("headless");
    LoadedRun run = a.flags.open_run(timer);

    if (a.flags.kind() == LoadKind::Map && run.sim.time() == Clock::zero()) {
      timer.start("spawn demand");
      const auto trips = spawn_demand(run.map, run.sim.rng(), a.profile);
      for (const auto& t : trips) run.sim.schedule_trip(run.map, t);
      timer.stop("spawn demand");
      spdlog::info("spawned {} {} trips on {}", trips.size(), to_string(a.profile), run.map.name());
    }

    std::vector<HaltCondition> conditions;
    if (a.save_at) conditions.push_back(SaveAt{*a.save_at, true});
    if (a.savestate_every) conditions.push_back(SaveEvery{*a.savestate_every});

    const RunOutcome outcome = run_until_done(run.sim, run.map, conditions, timer);
    for (const auto& p : outcome.saved) spdlog::info("saved {}", p);
    report(run.sim);
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const Error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  return 0;
}
