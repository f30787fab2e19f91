#include <tsim/spawner.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace tsim {

const char* to_string(DemandProfile p) {
  switch (p) {
    case DemandProfile::Small:   return "small";
    case DemandProfile::Big:     return "big";
    case DemandProfile::Weekday: return "weekday";
  }
  return "unknown";
}

std::optional<DemandProfile> demand_profile_from_string(std::string_view s) {
  for (DemandProfile p : {DemandProfile::Small, DemandProfile::Big, DemandProfile::Weekday}) {
    if (s == to_string(p)) return p;
  }
  return std::nullopt;
}

static Clock depart_between(RandomStream& rng, std::int64_t from_s, std::int64_t to_s) {
  return Clock::from_seconds(rng.uniform(from_s, to_s));
}

static Clock draw_departure(RandomStream& rng, DemandProfile profile) {
  switch (profile) {
    case DemandProfile::Small: return depart_between(rng, 0, 3600);
    case DemandProfile::Big:   return depart_between(rng, 0, 4 * 3600);
    case DemandProfile::Weekday: {
      const auto bucket = rng.uniform(0, 10);
      if (bucket < 4) return depart_between(rng, 6 * 3600 + 1800, 9 * 3600 + 1800);
      if (bucket < 8) return depart_between(rng, 15 * 3600 + 1800, 18 * 3600 + 1800);
      return depart_between(rng, 6 * 3600, 22 * 3600);
    }
  }
  return Clock::zero();
}

static TripMode draw_mode(RandomStream& rng, bool transit_possible) {
  const auto r = rng.uniform(0, 1000);
  if (r < 200) return TripMode::Walk;
  if (r < 450) return TripMode::Bike;
  if (r < 600 && transit_possible) return TripMode::Transit;
  return TripMode::Drive;
}

static std::size_t trip_count(const Map& map, DemandProfile profile) {
  switch (profile) {
    case DemandProfile::Small:   return 50;
    case DemandProfile::Big:     return 1000;
    case DemandProfile::Weekday: return 10 * map.buildings().size();
  }
  return 0;
}

std::vector<TripSpec> spawn_demand(const Map& map, RandomStream& rng, DemandProfile profile) {
  std::vector<TripSpec> trips;
  const auto n_bldgs = static_cast<std::int64_t>(map.buildings().size());
  if (n_bldgs < 2) return trips;

  // Transit only between stops that have a building next to them.
  std::vector<std::pair<const BusRoute*, std::vector<BuildingId>>> served;
  for (const auto& route : map.bus_routes()) {
    std::vector<BuildingId> stops;
    for (RoadId r : route.stops) {
      if (auto b = map.building_on(r)) stops.push_back(*b);
    }
    if (stops.size() >= 2) served.emplace_back(&route, std::move(stops));
  }

  const std::size_t n = trip_count(map, profile);
  trips.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    TripSpec t;
    t.depart = draw_departure(rng, profile);
    t.mode = draw_mode(rng, !served.empty());
    if (t.mode == TripMode::Transit) {
      const auto& stops = served[static_cast<std::size_t>(rng.uniform(0, static_cast<std::int64_t>(served.size())))].second;
      const auto count = static_cast<std::int64_t>(stops.size());
      const auto a = rng.uniform(0, count);
      const auto b = (a + rng.uniform(1, count)) % count;
      t.origin = stops[static_cast<std::size_t>(a)];
      t.destination = stops[static_cast<std::size_t>(b)];
    } else {
      const auto a = rng.uniform(0, n_bldgs);
      const auto b = (a + rng.uniform(1, n_bldgs)) % n_bldgs;
      t.origin = map.buildings()[static_cast<std::size_t>(a)].id;
      t.destination = map.buildings()[static_cast<std::size_t>(b)].id;
    }
    trips.push_back(t);
  }

  std::stable_sort(trips.begin(), trips.end(),
                   [](const TripSpec& a, const TripSpec& b){ return a.depart < b.depart; });
  spdlog::debug("spawned {} {} trips on {}", trips.size(), to_string(profile), map.name());
  return trips;
}

bool is_builtin_scenario(const std::string& name) {
  return name == kWeekdayScenario;
}

std::optional<Scenario> instantiate_builtin_scenario(const std::string& name, const Map& map,
                                                     RandomStream& rng) {
  if (!is_builtin_scenario(name)) return std::nullopt;
  Scenario s;
  s.name = name;
  s.map_name = map.name();
  s.trips = spawn_demand(map, rng, DemandProfile::Weekday);
  return s;
}

} // namespace tsim
