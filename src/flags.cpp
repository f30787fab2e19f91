#include <tsim/flags.hpp>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <tsim/errors.hpp>
#include <tsim/savestate.hpp>
#include <tsim/scenario.hpp>
#include <tsim/spawner.hpp>

namespace tsim {

namespace fs = std::filesystem;

static RandomStream make_rng(const std::optional<std::uint64_t>& seed) {
  if (seed) return RandomStream::seeded(*seed);
  return RandomStream::from_entropy();
}

static Map load_catalog_map(const std::string& path, const std::string& name, bool fixes) {
  auto map = map_by_name(name, fixes);
  if (!map) throw LoadError(path, "no map named '" + name + "'");
  return std::move(*map);
}

LoadedRun SimFlags::open_run(Timer& timer) const {
  const LoadKind k = kind();
  timer.start("load " + load);

  if (k == LoadKind::Savestate) {
    if (rng_seed) spdlog::info("ignoring rng_seed; the savestate carries its own RNG");
    if (!edits.empty()) spdlog::warn("ignoring edits {}; the savestate carries its own", edits.name);
    LoadedRun run = load_savestate(load);
    const SimOptions& kept = run.sim.options();
    if (opts.run_name != kept.run_name) {
      spdlog::warn("ignoring run name {}; later saves stay under the savestate's {}", opts.run_name,
                   kept.run_name);
    }
    if (opts.data_dir != kept.data_dir) {
      spdlog::warn("ignoring data_dir {}; later saves go to the savestate's {}", opts.data_dir,
                   kept.data_dir);
    }
    if (opts.step != kept.step) {
      spdlog::warn("ignoring step {}; the savestate steps by {}", opts.step.to_string(),
                   kept.step.to_string());
    }
    timer.stop("load " + load);
    return run;
  }

  const fs::path p(load);
  if (k == LoadKind::Scenario) {
    const std::string map_name = p.parent_path().filename().string();
    const std::string scenario_name = p.stem().string();
    Map map = load_catalog_map(load, map_name, use_map_fixes);
    map.apply_edits(edits);
    TrafficSim sim(map, make_rng(rng_seed), opts);

    if (fs::exists(p)) {
      const Scenario s = load_scenario(load);
      sim.schedule_scenario(map, s);
    } else if (auto s = instantiate_builtin_scenario(scenario_name, map, sim.rng())) {
      sim.schedule_scenario(map, *s);
    } else {
      throw LoadError(load, "no such scenario file, and '" + scenario_name + "' isn't built in");
    }
    timer.stop("load " + load);
    return LoadedRun{std::move(map), std::move(sim)};
  }

  Map map = load_catalog_map(load, p.filename().string(), use_map_fixes);
  map.apply_edits(edits);
  TrafficSim sim(map, make_rng(rng_seed), opts);
  timer.stop("load " + load);
  return LoadedRun{std::move(map), std::move(sim)};
}

} // namespace tsim
