#include <tsim/scenario.hpp>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <tsim/csv.hpp>
#include <tsim/errors.hpp>
#include <tsim/map.hpp>

namespace tsim {

static std::optional<TripSpec> parse_trip_row(const std::vector<std::string>& cols) {
  if (cols.size() != 4) return std::nullopt;
  const auto depart = Clock::parse(cols[0]);
  const auto origin = csv::to_int(cols[1]);
  const auto dest = csv::to_int(cols[2]);
  const auto mode = trip_mode_from_string(cols[3]);
  if (!depart || !origin || !dest || !mode) return std::nullopt;
  if (*origin < 0 || *dest < 0 || *origin > UINT32_MAX || *dest > UINT32_MAX) return std::nullopt;
  return TripSpec{*depart, static_cast<BuildingId>(*origin), static_cast<BuildingId>(*dest), *mode};
}

std::optional<Scenario> scenario_from_csv_stream(std::istream& in, const std::string& name) {
  Scenario s;
  s.name = name;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::skippable(raw)) continue;
    const auto cols = csv::split_line(raw);

    if (cols[0] == "map") {
      if (cols.size() != 2 || cols[1].empty() || !s.map_name.empty()) return std::nullopt;
      s.map_name = cols[1];
      continue;
    }
    if (!header_consumed && cols[0] == "depart") {
      header_consumed = true;
      continue;
    }
    auto trip = parse_trip_row(cols);
    if (!trip) return std::nullopt;
    s.trips.push_back(*trip);
  }
  if (s.map_name.empty()) return std::nullopt;

  std::stable_sort(s.trips.begin(), s.trips.end(),
                   [](const TripSpec& a, const TripSpec& b){ return a.depart < b.depart; });
  return s;
}

void write_scenario_csv(std::ostream& out, const Scenario& s) {
  out << "# tsim scenario " << s.name << '\n';
  out << "map," << s.map_name << '\n';
  out << "depart,origin,destination,mode\n";
  for (const auto& t : s.trips) {
    out << t.depart.format() << ',' << t.origin << ',' << t.destination << ','
        << to_string(t.mode) << '\n';
  }
}

Scenario load_scenario(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw LoadError(path, "can't open scenario");
  auto s = scenario_from_csv_stream(f, std::filesystem::path(path).stem().string());
  if (!s) throw LoadError(path, "malformed scenario");
  return *s;
}

void validate_scenario(const Scenario& s, const Map& map) {
  if (s.map_name != map.name()) {
    throw ConfigError("scenario " + s.name + " is for map " + s.map_name + ", not " + map.name());
  }
  const auto n = map.buildings().size();
  for (const auto& t : s.trips) {
    if (t.origin >= n || t.destination >= n) {
      throw ConfigError("scenario " + s.name + ": trip at " + t.depart.format() +
                        " uses a building " + map.name() + " doesn't have");
    }
  }
}

} // namespace tsim
