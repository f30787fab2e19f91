#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <tsim/errors.hpp>
#include <tsim/paths.hpp>
#include <tsim/prebake.hpp>

using namespace tsim;
namespace fs = std::filesystem;

static fs::path fresh_dir(const std::string& name) {
  const fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  return dir;
}

static DurationStats stats(std::int64_t base) {
  return DurationStats{3, Duration::from_ticks(base), Duration::from_ticks(base + 10),
                       Duration::from_ticks(base + 20), Duration::from_ticks(base + 30),
                       Duration::from_ticks(base + 40), Duration::from_ticks(base + 15)};
}

TEST_CASE("prebaked results CSV") {
  PrebakedResults r;
  r.maps["montlake"].faster_trips[TripMode::Bike] = stats(3000);
  r.maps["montlake"].faster_trips[TripMode::Drive] = stats(1500);
  r.maps["montlake"].bus_routes["48"] = stats(450);
  r.maps["montlake"].badness = Duration::hours(2);
  r.maps["montlake"].seed = 42;
  r.maps["23rd"].bus_routes["48"] = stats(380);

  SECTION("written rows") {
    std::ostringstream out;
    write_prebaked_csv(out, r);
    const std::string csv = out.str();
    REQUIRE(csv.rfind("kind,map,key,count,min,p50,p90,p99,max,mean\n", 0) == 0);
    REQUIRE(csv.find("faster_trips,montlake,Bike,3,3000,3010,3020,3030,3040,3015\n") != std::string::npos);
    REQUIRE(csv.find("bus_route,23rd,48,3,380,390,400,410,420,395\n") != std::string::npos);
    REQUIRE(csv.find("badness,montlake,total,1,72000,72000,72000,72000,72000,72000\n") != std::string::npos);
    REQUIRE(csv.find("seed,montlake,42,0,0,0,0,0,0,0\n") != std::string::npos);
    REQUIRE(csv.find("seed,23rd,") == std::string::npos);
  }

  SECTION("reads back") {
    std::stringstream ss;
    write_prebaked_csv(ss, r);
    auto back = prebaked_from_csv_stream(ss);
    REQUIRE(back.has_value());
    REQUIRE(*back == r);
    REQUIRE(back->for_map("montlake") != nullptr);
    REQUIRE(back->for_map("ballard") == nullptr);
  }

  SECTION("malformed rows reject the file") {
    for (const char* bad : {"faster_trips,montlake,Skate,1,1,1,1,1,1,1\n",
                            "faster_trips,montlake,Bike,1,1,1\n",
                            "faster_trips,montlake,Bike,x,1,1,1,1,1,1\n",
                            "speed,montlake,Bike,1,1,1,1,1,1,1\n",
                            "bus_route,,48,1,1,1,1,1,1,1\n",
                            "seed,montlake,-4,0,0,0,0,0,0,0\n",
                            "seed,montlake,1,0,0,0,0,0,0,0\nseed,montlake,2,0,0,0,0,0,0,0\n"}) {
      INFO(bad);
      std::istringstream in(bad);
      REQUIRE_FALSE(prebaked_from_csv_stream(in).has_value());
    }
  }
}

TEST_CASE("prebaked results files") {
  const fs::path dir = fresh_dir("tsim_test_prebake_files");
  const std::string path = path_prebaked_results(dir.string());

  REQUIRE_FALSE(load_prebaked_results(path).has_value());

  PrebakedResults r;
  r.maps["montlake"].faster_trips[TripMode::Walk] = stats(6000);
  save_prebaked_results(r, path);
  REQUIRE(load_prebaked_results(path) == r);
  REQUIRE_FALSE(fs::exists(path + ".tmp"));

  {
    std::ofstream f(path, std::ios::trunc);
    f << "kind,map,key\nnonsense\n";
  }
  REQUIRE_THROWS_AS(load_prebaked_results(path), LoadError);
  fs::remove_all(dir);
}

TEST_CASE("prebake needs a seed") {
  const fs::path dir = fresh_dir("tsim_test_prebake_seed");
  Timer timer("test");
  REQUIRE_THROWS_AS(prebake("montlake", kReferenceScenario, std::nullopt, dir.string(), timer),
                    ConfigError);
  REQUIRE_THROWS_AS(prebake_all(std::nullopt, dir.string(), timer), ConfigError);
  REQUIRE_FALSE(fs::exists(dir));
}

TEST_CASE("prebake records and merges baselines") {
  const fs::path dir = fresh_dir("tsim_test_prebake");
  const std::string path = path_prebaked_results(dir.string());
  Timer timer("test");

  const RunResults montlake = prebake("montlake", kReferenceScenario, 42, dir.string(), timer);
  REQUIRE(montlake.faster_trips.count(TripMode::Bike));
  REQUIRE(montlake.faster_trips.count(TripMode::Drive));
  REQUIRE(montlake.bus_routes.count("48"));
  REQUIRE(montlake.seed == std::optional<std::uint64_t>(42));

  // Same seed, same numbers.
  REQUIRE(run_reference("montlake", kReferenceScenario, 42, MapEdits{}, dir.string(), timer) == montlake);

  prebake("23rd", kReferenceScenario, 42, dir.string(), timer);
  const auto stored = load_prebaked_results(path);
  REQUIRE(stored.has_value());
  REQUIRE(stored->maps.size() == 2);
  REQUIRE(*stored->for_map("montlake") == montlake);
  REQUIRE(stored->for_map("23rd")->bus_routes.count("48"));

  fs::remove_all(dir);
}
