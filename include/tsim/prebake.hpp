#pragma once
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <tsim/edits.hpp>
#include <tsim/sim.hpp>
#include <tsim/stats.hpp>
#include <tsim/timer.hpp>

namespace tsim {

// The scenario every baseline and challenge run replays.
inline constexpr const char* kReferenceScenario = "weekday_typical_traffic_from_psrc";

// Everything a challenge can be scored on, from one finished run.
struct RunResults {
  std::map<TripMode, DurationStats> faster_trips;
  std::map<std::string, DurationStats> bus_routes;   // by route name
  Duration badness;
  // Seed the demand was drawn with; unset for results built by hand.
  std::optional<std::uint64_t> seed;

  bool operator==(const RunResults&) const = default;
};

// Baselines by map name. A challenge only ever reads its own map's entry.
struct PrebakedResults {
  std::map<std::string, RunResults> maps;

  const RunResults* for_map(const std::string& map_name) const;
  bool operator==(const PrebakedResults&) const = default;
};

RunResults collect_results(const TrafficSim& sim);

// Replays `scenario_name` on `map_name` (fixes on, then `edits`) from scratch
// with `seed`, until END_OF_DAY or completion.
RunResults run_reference(const std::string& map_name, const std::string& scenario_name,
                         std::uint64_t seed, const MapEdits& edits,
                         const std::string& data_dir, Timer& timer);

// Records the unedited baseline for one map and merges it into the results
// file; other maps' entries are kept. A missing seed is a ConfigError:
// baselines must be reproducible.
RunResults prebake(const std::string& map_name, const std::string& scenario_name,
                   std::optional<std::uint64_t> seed, const std::string& data_dir, Timer& timer);
// Every map some challenge targets.
PrebakedResults prebake_all(std::optional<std::uint64_t> seed, const std::string& data_dir,
                            Timer& timer);

// CSV: kind,map,key,count,min,p50,p90,p99,max,mean (durations in ticks).
// kind is faster_trips (key = mode), bus_route (key = route), badness
// (key = total, every duration column = badness) or seed (key = the seed,
// other columns 0).
void write_prebaked_csv(std::ostream& out, const PrebakedResults& r);
std::optional<PrebakedResults> prebaked_from_csv_stream(std::istream& in);

// Throws PersistenceError.
void save_prebaked_results(const PrebakedResults& r, const std::string& path);
// nullopt when the file doesn't exist; LoadError when it's malformed.
std::optional<PrebakedResults> load_prebaked_results(const std::string& path);

} // namespace tsim
