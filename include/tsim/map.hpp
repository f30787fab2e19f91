#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <tsim/edits.hpp>
#include <tsim/trip.hpp>

namespace tsim {

using IntersectionId = std::uint32_t;

struct Intersection {
  IntersectionId id = 0;
  std::int64_t x_mm = 0;
  std::int64_t y_mm = 0;
};

// Two-way road between two intersections.
struct Road {
  RoadId id = 0;
  std::string name;
  IntersectionId src = 0;
  IntersectionId dst = 0;
  std::int64_t length_mm = 0;
  std::int64_t speed_limit_mm_s = 0;
  int lanes = 1;
  bool bike_lane = false;
  bool bus_lane = false;
  bool closed = false;
};

// Trips start and end at buildings; a building fronts exactly one road.
struct Building {
  BuildingId id = 0;
  RoadId road = 0;
};

// Buses visit the stops in order and loop back to the first one.
// Route names are single tokens (no whitespace).
struct BusRoute {
  std::string name;
  std::vector<RoadId> stops;
};

// Parameters of a rectangular street grid.
struct GridSpec {
  std::string name;
  int cols = 2;                    // intersections per row
  int rows = 2;                    // intersections per column
  std::int64_t block_mm = 250000;
  std::int64_t speed_limit_kmh = 40;
  std::vector<std::string> row_streets;   // names for horizontal streets
  std::vector<std::string> col_streets;   // names for vertical streets
  std::vector<int> bike_lane_rows;        // horizontal streets with bike lanes
  int bus_route_col = -1;                 // vertical street served by the bus route, if any
  std::string bus_route_name = "48";
  MapEdits fixes;                         // known corrections to the raw data
};

class Map {
public:
  static Map from_grid(const GridSpec& spec);

  const std::string& name() const { return name_; }
  const std::vector<Intersection>& intersections() const { return intersections_; }
  const std::vector<Road>& roads() const { return roads_; }
  const std::vector<Building>& buildings() const { return buildings_; }
  const std::vector<BusRoute>& bus_routes() const { return bus_routes_; }

  // Throws std::out_of_range for unknown ids.
  const Road& road(RoadId id) const;
  const Building& building(BuildingId id) const;
  const BusRoute* bus_route(const std::string& name) const;
  std::optional<BuildingId> building_on(RoadId road) const;

  // Shortest route (by length) from the start of `from` to the end of `to`,
  // both included. Closed roads are never used. Ties resolve to lower road ids.
  std::optional<std::vector<RoadId>> pathfind(RoadId from, RoadId to) const;

  // Throws ConfigError on unknown roads or out-of-range values.
  void apply_edits(const MapEdits& edits);
  void apply_map_fixes();

  bool map_fixes_applied() const { return fixes_applied_; }
  // Every user edit applied so far, in order.
  const MapEdits& edits() const { return edits_; }

private:
  void apply_edit_(const MapEdit& e);
  void rebuild_adjacency_();

  std::string name_;
  std::vector<Intersection> intersections_;
  std::vector<Road> roads_;
  std::vector<Building> buildings_;
  std::vector<BusRoute> bus_routes_;
  std::vector<std::vector<RoadId>> roads_at_;   // per intersection, sorted
  MapEdits fixes_;
  bool fixes_applied_ = false;
  MapEdits edits_;
};

std::int64_t kmh_to_mm_s(std::int64_t kmh);

// Built-in maps: "montlake" and "23rd".
const std::vector<std::string>& map_names();
// Fresh copy of a catalog map; fixes applied when asked.
std::optional<Map> map_by_name(const std::string& name, bool use_map_fixes);

} // namespace tsim
