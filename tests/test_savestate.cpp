#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <tsim/driver.hpp>
#include <tsim/errors.hpp>
#include <tsim/flags.hpp>
#include <tsim/savestate.hpp>
#include <tsim/spawner.hpp>

using namespace tsim;
namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

static SimFlags weekday_flags(const fs::path& dir) {
  SimFlags flags;
  flags.load = path_scenario(dir.string(), "montlake", kWeekdayScenario);
  flags.rng_seed = 42;
  flags.opts.run_name = "weekday";
  flags.opts.data_dir = dir.string();
  return flags;
}

static std::string snapshot(const LoadedRun& run) {
  std::ostringstream out;
  write_savestate(out, run.map, run.sim);
  return out.str();
}

TEST_CASE("a resumed run matches an uninterrupted one") {
  const fs::path dir = fresh_dir("tsim_test_savestate");
  Timer timer("test");
  const SimFlags flags = weekday_flags(dir);
  REQUIRE(flags.kind() == LoadKind::Scenario);

  LoadedRun straight = flags.open_run(timer);
  run_until_done(straight.sim, straight.map, {TimeBound{Clock::end_of_day()}}, timer);
  REQUIRE(straight.sim.is_done());
  REQUIRE(straight.sim.finished_trips().size() > 200);

  // Same seed, stopped in the morning peak.
  LoadedRun first_half = flags.open_run(timer);
  const Clock at = *Clock::parse("8:00:00");
  const RunOutcome out = run_until_done(first_half.sim, first_half.map, {SaveAt{at, true}}, timer);
  REQUIRE(out.reason == StopReason::Halted);
  REQUIRE(out.saved.size() == 1);

  SimFlags resume;
  resume.load = out.saved[0];
  REQUIRE(resume.kind() == LoadKind::Savestate);
  LoadedRun second_half = resume.open_run(timer);
  REQUIRE(second_half.sim.time() == at);
  REQUIRE(second_half.sim.options() == first_half.sim.options());
  REQUIRE(snapshot(second_half) == snapshot(first_half));

  run_until_done(second_half.sim, second_half.map, {TimeBound{Clock::end_of_day()}}, timer);
  REQUIRE(second_half.sim.time() == straight.sim.time());
  REQUIRE(second_half.sim.finished_trips() == straight.sim.finished_trips());
  REQUIRE(second_half.sim.bus_legs() == straight.sim.bus_legs());
  REQUIRE(second_half.sim.badness() == straight.sim.badness());
  REQUIRE(second_half.sim.rng() == straight.sim.rng());

  fs::remove_all(dir);
}

TEST_CASE("savestates carry the map edits") {
  const fs::path dir = fresh_dir("tsim_test_savestate_edits");
  Timer timer("test");
  SimFlags flags = weekday_flags(dir);
  flags.edits = MapEdits{"lanes", {{3, EditKind::AddBikeLane, 0}, {16, EditKind::AddBusLane, 0}}};

  LoadedRun run = flags.open_run(timer);
  const std::string path = save(run.map, run.sim);
  REQUIRE(path == path_savestate(dir.string(), "weekday", Clock::zero()));

  const LoadedRun back = load_savestate(path);
  REQUIRE(back.map.name() == "montlake");
  REQUIRE(back.map.map_fixes_applied());
  REQUIRE(back.map.edits() == flags.edits);
  REQUIRE(back.map.road(3).bike_lane);
  REQUIRE(back.map.road(16).bus_lane);
  REQUIRE(back.sim.pending_trips() == run.sim.pending_trips());
  REQUIRE(snapshot(back) == snapshot(run));

  fs::remove_all(dir);
}

TEST_CASE("broken savestates are load errors") {
  const fs::path dir = fresh_dir("tsim_test_savestate_bad");
  fs::create_directories(dir);

  SECTION("missing file") {
    const std::string path = (dir / "save" / "x" / "10.sav").string();
    try {
      load_savestate(path);
      FAIL("expected LoadError");
    } catch (const LoadError& e) {
      REQUIRE(e.path() == path);
    }
  }

  SECTION("garbage") {
    const fs::path p = dir / "garbage.sav";
    {
      std::ofstream f(p);
      f << "this is not a savestate\n";
    }
    REQUIRE_THROWS_AS(load_savestate(p.string()), LoadError);
  }

  SECTION("truncated") {
    Timer timer("test");
    LoadedRun run = weekday_flags(dir).open_run(timer);
    const std::string full = snapshot(run);
    const fs::path p = dir / "truncated.sav";
    {
      std::ofstream f(p);
      f << full.substr(0, full.size() / 2);
    }
    REQUIRE_THROWS_AS(load_savestate(p.string()), LoadError);
  }

  SECTION("wrong version") {
    std::istringstream in("tsim-savestate 99\nmap \"montlake\" 1\n");
    REQUIRE_FALSE(read_savestate(in).has_value());
  }

  SECTION("unknown map") {
    std::istringstream in("tsim-savestate 1\nmap \"atlantis\" 1\nedits \"untitled\" 0\nengine\n");
    REQUIRE_FALSE(read_savestate(in).has_value());
  }

  fs::remove_all(dir);
}

TEST_CASE("saving somewhere unwritable is a persistence error") {
  const fs::path dir = fresh_dir("tsim_test_savestate_unwritable");
  fs::create_directories(dir);
  const fs::path blocker = dir / "file";
  {
    std::ofstream f(blocker);
    f << "x\n";
  }

  const Map m = *map_by_name("montlake", true);
  SimOptions opts;
  opts.data_dir = blocker.string();
  const TrafficSim sim(m, RandomStream::seeded(1), opts);
  REQUIRE_THROWS_AS(save(m, sim), PersistenceError);
  fs::remove_all(dir);
}

TEST_CASE("a savestate that can't be moved into place keeps the reason") {
  const fs::path dir = fresh_dir("tsim_test_savestate_rename");
  const Map m = *map_by_name("montlake", true);
  SimOptions opts;
  opts.data_dir = dir.string();
  const TrafficSim sim(m, RandomStream::seeded(1), opts);

  // A directory squatting on the savestate's name.
  const fs::path target = path_savestate(opts.data_dir, opts.run_name, sim.time());
  fs::create_directories(target / "occupied");

  const std::string why = std::make_error_code(std::errc::is_a_directory).message();
  try {
    save(m, sim);
    FAIL("save went through over a directory");
  } catch (const PersistenceError& e) {
    REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring(why));
  }
  REQUIRE_FALSE(fs::exists(target.string() + ".tmp"));
  fs::remove_all(dir);
}

TEST_CASE("a savestate keeps its own run options") {
  const fs::path dir = fresh_dir("tsim_test_savestate_opts");
  Timer timer("test");
  LoadedRun run = weekday_flags(dir).open_run(timer);
  const std::string path = save(run.map, run.sim);

  SimFlags resume;
  resume.load = path;
  resume.opts.run_name = "headless";
  resume.opts.data_dir = (dir / "elsewhere").string();

  auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
  auto previous = spdlog::default_logger();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("capture", sink));
  LoadedRun resumed = resume.open_run(timer);
  spdlog::set_default_logger(previous);

  REQUIRE(resumed.sim.options() == run.sim.options());
  REQUIRE(save(resumed.map, resumed.sim) == path);

  bool warned_name = false, warned_dir = false;
  for (const auto& line : sink->last_formatted()) {
    if (line.find("ignoring run name headless") != std::string::npos) warned_name = true;
    if (line.find("ignoring data_dir") != std::string::npos) warned_dir = true;
  }
  REQUIRE(warned_name);
  REQUIRE(warned_dir);
  fs::remove_all(dir);
}
