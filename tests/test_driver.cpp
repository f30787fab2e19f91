#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>

#include <tsim/driver.hpp>
#include <tsim/errors.hpp>
#include <tsim/map.hpp>
#include <tsim/paths.hpp>

using namespace tsim;
namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

static TrafficSim walk_sim(const Map& m, const fs::path& data_dir) {
  SimOptions opts;
  opts.run_name = "walk";
  opts.data_dir = data_dir.string();
  TrafficSim sim(m, RandomStream::seeded(11), opts);
  // About 14 minutes on foot.
  sim.schedule_trip(m, TripSpec{Clock::zero(), 0, 2, TripMode::Walk});
  return sim;
}

TEST_CASE("run_until_done with no demand") {
  const Map m = *map_by_name("montlake", true);
  TrafficSim sim(m, RandomStream::seeded(1), SimOptions{});
  Timer timer("test");

  const RunOutcome out = run_until_done(sim, m, {}, timer);
  REQUIRE(out.reason == StopReason::Completed);
  REQUIRE(out.end_time == Clock::zero());
  REQUIRE(out.saved.empty());
  REQUIRE(sim.finished_trips().empty());
  REQUIRE(timer.depth() == 0);
}

TEST_CASE("run_until_done halt conditions") {
  const Map m = *map_by_name("montlake", true);
  const fs::path dir = fresh_dir("tsim_test_driver");
  TrafficSim sim = walk_sim(m, dir);
  Timer timer("test");

  SECTION("runs to completion without conditions") {
    const RunOutcome out = run_until_done(sim, m, {}, timer);
    REQUIRE(out.reason == StopReason::Completed);
    REQUIRE(sim.finished_trips().size() == 1);
    REQUIRE(out.end_time == sim.time());
    REQUIRE(out.end_time > Clock::from_seconds(600));
  }

  SECTION("TimeBound") {
    const RunOutcome out = run_until_done(sim, m, {TimeBound{Clock::from_seconds(60)}}, timer);
    REQUIRE(out.reason == StopReason::Halted);
    REQUIRE(sim.time() == Clock::from_seconds(60));
    REQUIRE(sim.finished_trips().empty());
  }

  SECTION("Always stops after one step") {
    const RunOutcome out = run_until_done(sim, m, {Always{}}, timer);
    REQUIRE(out.reason == StopReason::Halted);
    REQUIRE(sim.time() == Clock::zero() + sim.options().step);
  }

  SECTION("every condition is evaluated, even after one asked to stop") {
    int calls = 0;
    Custom counter{"count", [&](const TrafficSim&) { ++calls; return false; }};
    run_until_done(sim, m, {Always{}, counter}, timer);
    REQUIRE(calls == 1);
  }

  SECTION("Custom predicate") {
    Custom first_arrival{"first arrival", [](const TrafficSim& s) { return !s.finished_trips().empty(); }};
    sim.schedule_trip(m, TripSpec{Clock::from_seconds(3600), 2, 0, TripMode::Walk});
    const RunOutcome out = run_until_done(sim, m, {first_arrival}, timer);
    REQUIRE(out.reason == StopReason::Halted);
    REQUIRE(sim.finished_trips().size() == 1);
    REQUIRE(sim.pending_trips() == 1);
  }

  SECTION("SaveAt can save without stopping") {
    const Clock at = Clock::from_seconds(30);
    const RunOutcome out = run_until_done(sim, m, {SaveAt{at, false}}, timer);
    REQUIRE(out.reason == StopReason::Completed);
    REQUIRE(out.saved.size() == 1);
    REQUIRE(out.saved[0] == path_savestate(dir.string(), "walk", at));
    REQUIRE(fs::exists(out.saved[0]));
  }

  SECTION("SaveAt fires when a step jumps past the mark") {
    SimOptions opts = sim.options();
    opts.step = Duration::seconds(7);
    TrafficSim coarse(m, RandomStream::seeded(11), opts);
    coarse.schedule_trip(m, TripSpec{Clock::zero(), 0, 2, TripMode::Walk});
    const RunOutcome out = run_until_done(coarse, m, {SaveAt{Clock::from_seconds(30), true}}, timer);
    REQUIRE(out.reason == StopReason::Halted);
    REQUIRE(coarse.time() == Clock::from_seconds(35));
    REQUIRE(out.saved.size() == 1);
  }

  SECTION("SaveEvery") {
    const RunOutcome out = run_until_done(sim, m, {SaveEvery{Duration::minutes(5)}}, timer);
    REQUIRE(out.reason == StopReason::Completed);
    REQUIRE(out.saved.size() >= 2);
    for (const auto& p : out.saved) REQUIRE(fs::exists(p));
    REQUIRE(out.saved[0] == path_savestate(dir.string(), "walk", Clock::from_seconds(300)));
  }

  SECTION("SaveEvery needs a positive period") {
    const Clock before = sim.time();
    REQUIRE_THROWS_AS(run_until_done(sim, m, {SaveEvery{Duration::zero()}}, timer), ConfigError);
    REQUIRE_THROWS_AS(run_until_done(sim, m, {TimeBound{Clock::end_of_day()},
                                              SaveEvery{Duration::minutes(-1)}}, timer),
                      ConfigError);
    // Rejected up front: the engine never moved.
    REQUIRE(sim.time() == before);
    REQUIRE(sim.finished_trips().size() == 0u);
  }

  fs::remove_all(dir);
}

TEST_CASE("a failed save stops the run") {
  const Map m = *map_by_name("montlake", true);
  const fs::path dir = fresh_dir("tsim_test_driver_fail");
  fs::create_directories(dir);
  const fs::path blocker = dir / "not_a_dir";
  {
    std::ofstream f(blocker);
    f << "in the way\n";
  }

  TrafficSim sim = walk_sim(m, blocker);
  Timer timer("test");
  REQUIRE_THROWS_AS(run_until_done(sim, m, {SaveAt{Clock::from_seconds(10), true}}, timer),
                    PersistenceError);
  REQUIRE(sim.time() == Clock::from_seconds(10));
  fs::remove_all(dir);
}

TEST_CASE("stop reasons have names") {
  REQUIRE(std::string(to_string(StopReason::Completed)) == "completed");
  REQUIRE(std::string(to_string(StopReason::Halted)) == "halted");
}
