#include <catch2/catch_test_macros.hpp>
#include <filesystem>

#include <tsim/errors.hpp>
#include <tsim/evaluator.hpp>
#include <tsim/map.hpp>

using namespace tsim;
namespace fs = std::filesystem;

static DurationStats median_of(std::int64_t secs) {
  const Duration d = Duration::seconds(secs);
  return DurationStats{1, d, d, d, d, d, d};
}

static const Challenge& bikes() { return all_challenges()[3]; }
static const Challenge& route48() { return all_challenges()[0]; }
static const Challenge& gridlock() { return all_challenges()[2]; }

TEST_CASE("evaluate faster trips") {
  PrebakedResults base;
  base.maps["montlake"].faster_trips[TripMode::Bike] = median_of(600);
  RunResults now;

  SECTION("a minute faster passes, right at the line") {
    now.faster_trips[TripMode::Bike] = median_of(540);
    REQUIRE(evaluate(bikes(), now, base).passed);
  }

  SECTION("59 seconds faster fails") {
    now.faster_trips[TripMode::Bike] = median_of(541);
    const Verdict v = evaluate(bikes(), now, base);
    REQUIRE_FALSE(v.passed);
    REQUIRE_FALSE(v.reason.empty());
  }

  SECTION("no bike trips at all is a fail, not an error") {
    now.faster_trips[TripMode::Drive] = median_of(1);
    REQUIRE_FALSE(evaluate(bikes(), now, base).passed);
  }

  SECTION("missing baselines are errors") {
    now.faster_trips[TripMode::Bike] = median_of(10);
    REQUIRE_THROWS_AS(evaluate(bikes(), now, PrebakedResults{}), ChallengeError);
    PrebakedResults no_bikes;
    no_bikes.maps["montlake"].faster_trips[TripMode::Walk] = median_of(600);
    REQUIRE_THROWS_AS(evaluate(bikes(), now, no_bikes), ChallengeError);
  }
}

TEST_CASE("evaluate bus routes") {
  PrebakedResults base;
  base.maps["montlake"].bus_routes["48"] = median_of(120);
  RunResults now;

  now.bus_routes["48"] = median_of(90);
  REQUIRE(evaluate(route48(), now, base).passed);
  now.bus_routes["48"] = median_of(100);
  REQUIRE_FALSE(evaluate(route48(), now, base).passed);
  now.bus_routes.clear();
  REQUIRE_FALSE(evaluate(route48(), now, base).passed);

  // Other maps' baselines don't count.
  PrebakedResults elsewhere;
  elsewhere.maps["23rd"].bus_routes["48"] = median_of(120);
  REQUIRE_THROWS_AS(evaluate(route48(), now, elsewhere), ChallengeError);
}

TEST_CASE("evaluate gridlock needs no baseline") {
  RunResults now;
  now.badness = Duration::hours(kGridlockBadnessHours);
  REQUIRE_FALSE(evaluate(gridlock(), now, PrebakedResults{}).passed);
  now.badness = now.badness + Duration::from_ticks(1);
  REQUIRE(evaluate(gridlock(), now, PrebakedResults{}).passed);
}

TEST_CASE("evaluate rejects goals that don't fit the gameplay") {
  Challenge odd = bikes();
  odd.gameplay = CreateGridlock{};
  PrebakedResults base;
  base.maps["montlake"].faster_trips[TripMode::Bike] = median_of(600);
  REQUIRE_THROWS_AS(evaluate(odd, RunResults{}, base), ChallengeError);

  Challenge wrong_mode = bikes();
  wrong_mode.gameplay = FasterTrips{TripMode::Walk};
  REQUIRE_THROWS_AS(evaluate(wrong_mode, RunResults{}, base), ChallengeError);

  Challenge wrong_route = route48();
  wrong_route.gameplay = OptimizeBus{"8"};
  REQUIRE_THROWS_AS(evaluate(wrong_route, RunResults{}, base), ChallengeError);
}

static MapEdits everywhere(EditKind kind) {
  MapEdits e{to_string(kind), {}};
  const Map m = *map_by_name("montlake", true);
  for (const auto& r : m.roads()) e.commands.push_back({r.id, kind, 0});
  return e;
}

TEST_CASE("montlake bike challenge end to end") {
  const fs::path dir = fs::temp_directory_path() / "tsim_test_bike_challenge";
  fs::remove_all(dir);
  Timer timer("test");

  const RunResults baseline = prebake("montlake", kReferenceScenario, 42, dir.string(), timer);
  const Duration d = baseline.faster_trips.at(TripMode::Bike).p50;

  SECTION("bike lanes everywhere pass") {
    const ChallengeRun run = run_challenge(bikes(), everywhere(EditKind::AddBikeLane), 42,
                                           dir.string(), timer);
    REQUIRE(run.verdict.passed);
    REQUIRE(run.results.faster_trips.at(TripMode::Bike).p50 <= d - Duration::minutes(1));
  }

  SECTION("the unmodified map reproduces the baseline and fails") {
    const ChallengeRun run = run_challenge(bikes(), MapEdits{}, 42, dir.string(), timer);
    REQUIRE(run.results == baseline);
    REQUIRE(run.results.faster_trips.at(TripMode::Bike).p50 == d);
    REQUIRE_FALSE(run.verdict.passed);
  }

  SECTION("a different seed than the baseline's is refused") {
    REQUIRE_THROWS_AS(run_challenge(bikes(), MapEdits{}, 43, dir.string(), timer), ConfigError);
  }

  SECTION("no seed, no run") {
    REQUIRE_THROWS_AS(run_challenge(bikes(), MapEdits{}, std::nullopt, dir.string(), timer),
                      ConfigError);
  }

  fs::remove_all(dir);
}

TEST_CASE("closing every road is gridlock") {
  const fs::path dir = fs::temp_directory_path() / "tsim_test_gridlock";
  fs::remove_all(dir);
  Timer timer("test");

  const ChallengeRun run = run_challenge(gridlock(), everywhere(EditKind::CloseRoad), 7,
                                         dir.string(), timer);
  REQUIRE(run.verdict.passed);
  REQUIRE(run.results.faster_trips.empty());
  REQUIRE(run.results.badness > Duration::hours(kGridlockBadnessHours));

  // Without a prebaked file, goals that need a baseline can't be scored.
  REQUIRE_THROWS_AS(run_challenge(bikes(), MapEdits{}, 7, dir.string(), timer), ChallengeError);
  fs::remove_all(dir);
}
