#include <tsim/prebake.hpp>
#include <filesystem>
#include <fstream>
#include <set>
#include <spdlog/spdlog.h>
#include <tsim/challenges.hpp>
#include <tsim/csv.hpp>
#include <tsim/driver.hpp>
#include <tsim/errors.hpp>
#include <tsim/flags.hpp>
#include <tsim/paths.hpp>

namespace tsim {

namespace fs = std::filesystem;

const RunResults* PrebakedResults::for_map(const std::string& map_name) const {
  auto it = maps.find(map_name);
  return it == maps.end() ? nullptr : &it->second;
}

RunResults collect_results(const TrafficSim& sim) {
  RunResults r;
  r.faster_trips = from_ledger(sim.finished_trips());
  r.bus_routes = bus_route_stats(sim.bus_legs());
  r.badness = sim.badness();
  return r;
}

RunResults run_reference(const std::string& map_name, const std::string& scenario_name,
                         std::uint64_t seed, const MapEdits& edits,
                         const std::string& data_dir, Timer& timer) {
  SimFlags flags;
  flags.load = path_scenario(data_dir, map_name, scenario_name);
  flags.use_map_fixes = true;
  flags.rng_seed = seed;
  flags.edits = edits;
  flags.opts.run_name = "prebaked";
  flags.opts.data_dir = data_dir;

  LoadedRun run = flags.open_run(timer);
  run_until_done(run.sim, run.map, {TimeBound{Clock::end_of_day()}}, timer);

  timer.start("collect results");
  RunResults r = collect_results(run.sim);
  r.seed = seed;
  timer.stop("collect results");
  return r;
}

RunResults prebake(const std::string& map_name, const std::string& scenario_name,
                   std::optional<std::uint64_t> seed, const std::string& data_dir, Timer& timer) {
  if (!seed) {
    throw ConfigError("prebaking " + map_name + " needs an explicit RNG seed");
  }
  timer.start("prebake faster trips on " + map_name);
  RunResults r = run_reference(map_name, scenario_name, *seed, MapEdits{}, data_dir, timer);

  const std::string path = path_prebaked_results(data_dir);
  PrebakedResults all = load_prebaked_results(path).value_or(PrebakedResults{});
  all.maps[map_name] = r;
  save_prebaked_results(all, path);
  timer.stop("prebake faster trips on " + map_name);
  return r;
}

PrebakedResults prebake_all(std::optional<std::uint64_t> seed, const std::string& data_dir,
                            Timer& timer) {
  if (!seed) throw ConfigError("prebaking needs an explicit RNG seed");
  std::set<std::string> maps;
  for (const auto& c : all_challenges()) maps.insert(c.map_name);

  PrebakedResults out;
  for (const auto& m : maps) {
    out.maps[m] = prebake(m, kReferenceScenario, seed, data_dir, timer);
  }
  return out;
}

static void write_row(std::ostream& out, const char* kind, const std::string& map,
                      const std::string& key, const DurationStats& s) {
  out << kind << ',' << map << ',' << key << ',' << s.count << ',' << s.min.ticks() << ','
      << s.p50.ticks() << ',' << s.p90.ticks() << ',' << s.p99.ticks() << ','
      << s.max.ticks() << ',' << s.mean.ticks() << '\n';
}

void write_prebaked_csv(std::ostream& out, const PrebakedResults& r) {
  out << "kind,map,key,count,min,p50,p90,p99,max,mean\n";
  for (const auto& [map, res] : r.maps) {
    for (const auto& [mode, s] : res.faster_trips) write_row(out, "faster_trips", map, to_string(mode), s);
    for (const auto& [route, s] : res.bus_routes) write_row(out, "bus_route", map, route, s);
    const Duration b = res.badness;
    write_row(out, "badness", map, "total", DurationStats{1, b, b, b, b, b, b});
    if (res.seed) write_row(out, "seed", map, std::to_string(*res.seed), DurationStats{});
  }
}

static std::optional<DurationStats> parse_stats(const std::vector<std::string>& cols) {
  std::int64_t v[7];
  for (int i = 0; i < 7; ++i) {
    const auto x = csv::to_int(cols[3 + i]);
    if (!x) return std::nullopt;
    v[i] = *x;
  }
  if (v[0] < 0) return std::nullopt;
  return DurationStats{static_cast<std::uint64_t>(v[0]), Duration::from_ticks(v[1]),
                       Duration::from_ticks(v[2]), Duration::from_ticks(v[3]),
                       Duration::from_ticks(v[4]), Duration::from_ticks(v[5]),
                       Duration::from_ticks(v[6])};
}

std::optional<PrebakedResults> prebaked_from_csv_stream(std::istream& in) {
  PrebakedResults out;
  std::string line;
  bool header_consumed = false;
  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::skippable(raw)) continue;
    const auto cols = csv::split_line(raw);
    if (!header_consumed && cols[0] == "kind") {
      header_consumed = true;
      continue;
    }
    if (cols.size() != 10 || cols[1].empty() || cols[2].empty()) return std::nullopt;
    const auto stats = parse_stats(cols);
    if (!stats) return std::nullopt;

    RunResults& res = out.maps[cols[1]];
    if (cols[0] == "faster_trips") {
      const auto mode = trip_mode_from_string(cols[2]);
      if (!mode || !res.faster_trips.emplace(*mode, *stats).second) return std::nullopt;
    } else if (cols[0] == "bus_route") {
      if (!res.bus_routes.emplace(cols[2], *stats).second) return std::nullopt;
    } else if (cols[0] == "badness") {
      res.badness = stats->mean;
    } else if (cols[0] == "seed") {
      const auto seed = csv::to_uint(cols[2]);
      if (!seed || res.seed) return std::nullopt;
      res.seed = *seed;
    } else {
      return std::nullopt;
    }
  }
  return out;
}

void save_prebaked_results(const PrebakedResults& r, const std::string& path) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw PersistenceError(path, ec.message());
  }
  const fs::path tmp = target.string() + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f) throw PersistenceError(path, "can't open " + tmp.string() + " for writing");
    write_prebaked_csv(f, r);
    f.flush();
    if (!f) throw PersistenceError(path, "write failed");
  }
  fs::rename(tmp, target, ec);
  if (ec) throw PersistenceError(path, ec.message());
  spdlog::info("wrote prebaked results for {} map(s) to {}", r.maps.size(), path);
}

std::optional<PrebakedResults> load_prebaked_results(const std::string& path) {
  if (!fs::exists(path)) return std::nullopt;
  std::ifstream f(path);
  if (!f) throw LoadError(path, "can't open prebaked results");
  auto r = prebaked_from_csv_stream(f);
  if (!r) throw LoadError(path, "malformed prebaked results");
  return r;
}

} // namespace tsim
