#include <tsim/paths.hpp>
#include <filesystem>

namespace tsim {

namespace fs = std::filesystem;

std::string path_map(const std::string& data_dir, const std::string& map_name) {
  return (fs::path(data_dir) / "maps" / map_name).string();
}

std::string path_scenario(const std::string& data_dir, const std::string& map_name,
                          const std::string& scenario_name) {
  return (fs::path(data_dir) / "scenarios" / map_name / (scenario_name + ".csv")).string();
}

std::string path_savestate(const std::string& data_dir, const std::string& scenario_name, Clock at) {
  return (fs::path(data_dir) / "save" / scenario_name / (std::to_string(at.ticks()) + ".sav")).string();
}

std::string path_prebaked_results(const std::string& data_dir) {
  return (fs::path(data_dir) / "prebaked_results.csv").string();
}

const char* to_string(LoadKind k) {
  switch (k) {
    case LoadKind::Map:       return "map";
    case LoadKind::Scenario:  return "scenario";
    case LoadKind::Savestate: return "savestate";
  }
  return "unknown";
}

LoadKind classify_load_path(const std::string& path) {
  const fs::path p(path);
  if (p.extension() == ".sav") return LoadKind::Savestate;
  // Only the trailing <kind>/<name>/<file> components count; the data dir
  // itself may live anywhere.
  const fs::path grandparent = p.parent_path().parent_path().filename();
  if (grandparent == "save") return LoadKind::Savestate;
  if (grandparent == "scenarios" && p.extension() == ".csv") return LoadKind::Scenario;
  return LoadKind::Map;
}

} // namespace tsim
