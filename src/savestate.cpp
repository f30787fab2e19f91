#include <tsim/savestate.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <spdlog/spdlog.h>
#include <tsim/errors.hpp>
#include <tsim/paths.hpp>

namespace tsim {

namespace fs = std::filesystem;

void write_savestate(std::ostream& out, const Map& map, const TrafficSim& sim) {
  out << "tsim-savestate " << kSavestateVersion << '\n';
  out << "map " << std::quoted(map.name()) << ' ' << (map.map_fixes_applied() ? 1 : 0) << '\n';
  const auto& edits = map.edits();
  out << "edits " << std::quoted(edits.name) << ' ' << edits.commands.size() << '\n';
  for (const auto& e : edits.commands) {
    out << e.road << ' ' << static_cast<int>(e.kind) << ' ' << e.value << '\n';
  }
  out << "engine\n";
  sim.write_state(out);
}

std::optional<LoadedRun> read_savestate(std::istream& in) {
  std::string word;
  int version = 0;
  if (!(in >> word >> version) || word != "tsim-savestate" || version != kSavestateVersion) {
    return std::nullopt;
  }

  std::string map_name;
  int fixes = 0;
  if (!(in >> word) || word != "map" || !(in >> std::quoted(map_name) >> fixes)) return std::nullopt;
  auto map = map_by_name(map_name, fixes != 0);
  if (!map) return std::nullopt;

  MapEdits edits;
  std::size_t n = 0;
  if (!(in >> word) || word != "edits" || !(in >> std::quoted(edits.name) >> n)) return std::nullopt;
  for (std::size_t i = 0; i < n; ++i) {
    MapEdit e;
    int kind = 0;
    if (!(in >> e.road >> kind >> e.value)) return std::nullopt;
    if (kind < 0 || kind > static_cast<int>(EditKind::SetSpeedLimit)) return std::nullopt;
    e.kind = static_cast<EditKind>(kind);
    edits.commands.push_back(e);
  }
  try {
    map->apply_edits(edits);
  } catch (const ConfigError& err) {
    spdlog::error("savestate edits don't apply: {}", err.what());
    return std::nullopt;
  }

  if (!(in >> word) || word != "engine") return std::nullopt;
  auto sim = TrafficSim::read_state(in, *map);
  if (!sim) return std::nullopt;
  return LoadedRun{std::move(*map), std::move(*sim)};
}

std::string save(const Map& map, const TrafficSim& sim) {
  const auto& opts = sim.options();
  const std::string path = path_savestate(opts.data_dir, opts.run_name, sim.time());
  const fs::path target(path);
  const fs::path tmp = target.string() + ".tmp";

  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) throw PersistenceError(path, ec.message());

  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f) throw PersistenceError(path, "can't open " + tmp.string() + " for writing");
    write_savestate(f, map, sim);
    f.flush();
    if (!f) throw PersistenceError(path, "write failed");
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    const std::string reason = "couldn't move savestate into place: " + ec.message();
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw PersistenceError(path, reason);
  }
  spdlog::info("saved {} at {}", path, sim.time().format());
  return path;
}

LoadedRun load_savestate(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw LoadError(path, "can't open savestate");
  auto run = read_savestate(f);
  if (!run) throw LoadError(path, "corrupt savestate");
  spdlog::info("loaded savestate {} ({} at {})", path, run->map.name(), run->sim.time().format());
  return std::move(*run);
}

} // namespace tsim
