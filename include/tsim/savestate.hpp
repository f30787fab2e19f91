#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <tsim/sim.hpp>

namespace tsim {

inline constexpr int kSavestateVersion = 1;

// Self-describing text snapshot: map identity (catalog name, fixes, edits)
// followed by the complete engine state.
void write_savestate(std::ostream& out, const Map& map, const TrafficSim& sim);
// nullopt on any malformed or inconsistent content.
std::optional<LoadedRun> read_savestate(std::istream& in);

// Writes <data_dir>/save/<run name>/<ticks>.sav for the engine's current time
// and returns the path. The file appears only once fully written.
// Throws PersistenceError.
std::string save(const Map& map, const TrafficSim& sim);

// Throws LoadError naming the path.
LoadedRun load_savestate(const std::string& path);

} // namespace tsim
