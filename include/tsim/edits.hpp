#pragma once
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace tsim {

using RoadId = std::uint32_t;

enum class EditKind : int {
  AddBikeLane = 0,
  AddBusLane = 1,
  CloseRoad = 2,
  SetLanes = 3,        // value = lane count (>= 1)
  SetSpeedLimit = 4,   // value = km/h (>= 1)
};

const char* to_string(EditKind k);
std::optional<EditKind> edit_kind_from_string(std::string_view s);

struct MapEdit {
  RoadId road = 0;
  EditKind kind = EditKind::AddBikeLane;
  std::int64_t value = 0;

  bool operator==(const MapEdit&) const = default;
};

// Ordered changes to a map's roads, applied on top of the catalog map.
struct MapEdits {
  std::string name = "untitled";
  std::vector<MapEdit> commands;

  bool empty() const { return commands.empty(); }
  bool operator==(const MapEdits&) const = default;
};

// CSV: road,change[,value]. Optional header row starting with "road", '#'
// comments and blank lines are ignored. Throws ConfigError naming the line of
// the first invalid row.
MapEdits edits_from_csv_stream(std::istream& in, const std::string& name);

// nullopt if the file can't be opened.
std::optional<MapEdits> load_edits_csv(const std::string& path);

void write_edits_csv(std::ostream& out, const MapEdits& edits);

} // namespace tsim
