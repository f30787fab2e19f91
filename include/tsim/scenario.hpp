#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <tsim/trip.hpp>

namespace tsim {

class Map;

// Named, reproducible demand over one map.
struct Scenario {
  std::string name;
  std::string map_name;
  std::vector<TripSpec> trips;   // sorted by departure

  bool operator==(const Scenario&) const = default;
};

// Format:
//   map,<map name>
//   depart,origin,destination,mode
//   08:15:00.0,3,11,Bike
// '#' comments and blank lines are ignored. Unlike the edits reader this
// rejects the whole file on any bad row: a half-loaded scenario isn't the
// scenario that was asked for.
std::optional<Scenario> scenario_from_csv_stream(std::istream& in, const std::string& name);
void write_scenario_csv(std::ostream& out, const Scenario& s);

// Throws LoadError when the file is missing or malformed.
Scenario load_scenario(const std::string& path);

// Throws ConfigError if a trip names a building the map doesn't have.
void validate_scenario(const Scenario& s, const Map& map);

} // namespace tsim
