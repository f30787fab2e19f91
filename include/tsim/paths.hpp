#pragma once
#include <string>
#include <tsim/clock.hpp>

namespace tsim {

// Layout under a data directory:
//   maps/<map>                          (catalog maps, the path only names them)
//   scenarios/<map>/<scenario>.csv
//   save/<scenario>/<ticks>.sav
//   prebaked_results.csv
std::string path_map(const std::string& data_dir, const std::string& map_name);
std::string path_scenario(const std::string& data_dir, const std::string& map_name,
                          const std::string& scenario_name);
std::string path_savestate(const std::string& data_dir, const std::string& scenario_name, Clock at);
std::string path_prebaked_results(const std::string& data_dir);

enum class LoadKind : int { Map = 0, Scenario = 1, Savestate = 2 };

const char* to_string(LoadKind k);
// Decided from the path's shape only; the file may not exist.
LoadKind classify_load_path(const std::string& path);

} // namespace tsim
