#include <tsim/edits.hpp>
#include <filesystem>
#include <fstream>
#include <tsim/csv.hpp>
#include <tsim/errors.hpp>

namespace tsim {

const char* to_string(EditKind k) {
  switch (k) {
    case EditKind::AddBikeLane:   return "add_bike_lane";
    case EditKind::AddBusLane:    return "add_bus_lane";
    case EditKind::CloseRoad:     return "close_road";
    case EditKind::SetLanes:      return "set_lanes";
    case EditKind::SetSpeedLimit: return "set_speed_limit";
  }
  return "unknown";
}

std::optional<EditKind> edit_kind_from_string(std::string_view s) {
  for (EditKind k : {EditKind::AddBikeLane, EditKind::AddBusLane, EditKind::CloseRoad,
                     EditKind::SetLanes, EditKind::SetSpeedLimit}) {
    if (s == to_string(k)) return k;
  }
  return std::nullopt;
}

static bool takes_value(EditKind k) {
  return k == EditKind::SetLanes || k == EditKind::SetSpeedLimit;
}

static std::optional<MapEdit> parse_edit_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2 || cols.size() > 3) return std::nullopt;
  const auto road = csv::to_int(cols[0]);
  if (!road || *road < 0 || *road > static_cast<std::int64_t>(UINT32_MAX)) return std::nullopt;
  const auto kind = edit_kind_from_string(cols[1]);
  if (!kind) return std::nullopt;

  MapEdit e{static_cast<RoadId>(*road), *kind, 0};
  if (takes_value(*kind)) {
    if (cols.size() != 3) return std::nullopt;
    const auto v = csv::to_int(cols[2]);
    if (!v || *v < 1) return std::nullopt;
    e.value = *v;
  } else if (cols.size() == 3 && !cols[2].empty()) {
    return std::nullopt;
  }
  return e;
}

MapEdits edits_from_csv_stream(std::istream& in, const std::string& name) {
  MapEdits out;
  out.name = name;
  std::string line;
  std::size_t line_no = 0;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    ++line_no;
    std::string raw = csv::trim(line);
    if (csv::skippable(raw)) continue;

    auto cols = csv::split_line(raw);
    if (!header_consumed && (cols[0] == "road" || cols[0] == "Road")) {
      header_consumed = true;
      continue;
    }

    auto edit = parse_edit_row(cols);
    if (!edit) {
      throw ConfigError("edits '" + name + "' line " + std::to_string(line_no) +
                        ": can't parse '" + raw + "'");
    }
    out.commands.push_back(*edit);
  }
  return out;
}

std::optional<MapEdits> load_edits_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return edits_from_csv_stream(f, std::filesystem::path(path).stem().string());
}

void write_edits_csv(std::ostream& out, const MapEdits& edits) {
  out << "road,change,value\n";
  for (const auto& e : edits.commands) {
    out << e.road << ',' << to_string(e.kind);
    if (takes_value(e.kind)) out << ',' << e.value;
    out << '\n';
  }
}

} // namespace tsim
