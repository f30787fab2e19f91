#include <tsim/map.hpp>
#include <algorithm>
#include <functional>
#include <limits>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <tsim/errors.hpp>

namespace tsim {

std::int64_t kmh_to_mm_s(std::int64_t kmh) {
  return kmh * 1000000 / 3600;
}

static std::string street_name(const std::vector<std::string>& names, int idx, const char* fallback) {
  if (idx >= 0 && static_cast<std::size_t>(idx) < names.size()) return names[idx];
  return std::string(fallback) + " " + std::to_string(idx + 1);
}

Map Map::from_grid(const GridSpec& spec) {
  Map m;
  m.name_ = spec.name;
  m.fixes_ = spec.fixes;
  m.fixes_.name = spec.name + "_fixes";

  const int cols = std::max(1, spec.cols);
  const int rows = std::max(1, spec.rows);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      m.intersections_.push_back(Intersection{
        static_cast<IntersectionId>(r * cols + c), c * spec.block_mm, r * spec.block_mm});
    }
  }

  auto add_road = [&](std::string name, int a, int b, bool bike) {
    Road road;
    road.id = static_cast<RoadId>(m.roads_.size());
    road.name = std::move(name);
    road.src = static_cast<IntersectionId>(a);
    road.dst = static_cast<IntersectionId>(b);
    road.length_mm = spec.block_mm;
    road.speed_limit_mm_s = kmh_to_mm_s(spec.speed_limit_kmh);
    road.lanes = 1;
    road.bike_lane = bike;
    m.roads_.push_back(road);
    // One building per block face.
    m.buildings_.push_back(Building{static_cast<BuildingId>(road.id), road.id});
    return road.id;
  };

  for (int r = 0; r < rows; ++r) {
    const bool bike = std::find(spec.bike_lane_rows.begin(), spec.bike_lane_rows.end(), r) !=
                      spec.bike_lane_rows.end();
    const std::string street = street_name(spec.row_streets, r, "Row");
    for (int c = 0; c + 1 < cols; ++c) {
      add_road(street + " #" + std::to_string(c + 1), r * cols + c, r * cols + c + 1, bike);
    }
  }
  for (int c = 0; c < cols; ++c) {
    const std::string street = street_name(spec.col_streets, c, "Col");
    const bool served = c == spec.bus_route_col;
    BusRoute route{spec.bus_route_name, {}};
    for (int r = 0; r + 1 < rows; ++r) {
      const RoadId id = add_road(street + " #" + std::to_string(r + 1), r * cols + c, (r + 1) * cols + c, false);
      if (served) route.stops.push_back(id);
    }
    if (served && route.stops.size() >= 2) m.bus_routes_.push_back(std::move(route));
  }

  m.rebuild_adjacency_();
  return m;
}

void Map::rebuild_adjacency_() {
  roads_at_.assign(intersections_.size(), {});
  for (const auto& r : roads_) {
    roads_at_[r.src].push_back(r.id);
    roads_at_[r.dst].push_back(r.id);
  }
  for (auto& v : roads_at_) std::sort(v.begin(), v.end());
}

const Road& Map::road(RoadId id) const {
  if (id >= roads_.size()) throw std::out_of_range("no road " + std::to_string(id) + " in " + name_);
  return roads_[id];
}

const Building& Map::building(BuildingId id) const {
  if (id >= buildings_.size()) throw std::out_of_range("no building " + std::to_string(id) + " in " + name_);
  return buildings_[id];
}

const BusRoute* Map::bus_route(const std::string& name) const {
  for (const auto& r : bus_routes_) if (r.name == name) return &r;
  return nullptr;
}

std::optional<BuildingId> Map::building_on(RoadId road) const {
  for (const auto& b : buildings_) if (b.road == road) return b.id;
  return std::nullopt;
}

std::optional<std::vector<RoadId>> Map::pathfind(RoadId from, RoadId to) const {
  if (from >= roads_.size() || to >= roads_.size()) return std::nullopt;
  if (roads_[from].closed || roads_[to].closed) return std::nullopt;

  // Node = (road, end we leave it by): 2 * road + (0 = src, 1 = dst).
  constexpr std::int64_t kInf = std::numeric_limits<std::int64_t>::max();
  const std::size_t n = roads_.size() * 2;
  std::vector<std::int64_t> dist(n, kInf);
  std::vector<std::size_t> prev(n, n);
  using Entry = std::tuple<std::int64_t, RoadId, std::uint32_t>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> pq;

  for (std::uint32_t end = 0; end < 2; ++end) {
    dist[from * 2 + end] = roads_[from].length_mm;
    pq.emplace(roads_[from].length_mm, from, end);
  }

  std::optional<std::size_t> goal;
  while (!pq.empty()) {
    const auto [cost, rid, end] = pq.top();
    pq.pop();
    const std::size_t node = rid * 2 + end;
    if (cost != dist[node]) continue;
    if (rid == to) { goal = node; break; }

    const Road& cur = roads_[rid];
    const IntersectionId at = end == 0 ? cur.src : cur.dst;
    for (RoadId next_id : roads_at_[at]) {
      if (next_id == rid) continue;
      const Road& next = roads_[next_id];
      if (next.closed) continue;
      // Entering at `at`, leaving by the other end.
      const std::uint32_t next_end = next.src == at ? 1 : 0;
      const std::size_t next_node = next_id * 2 + next_end;
      const std::int64_t c = cost + next.length_mm;
      if (c < dist[next_node]) {
        dist[next_node] = c;
        prev[next_node] = node;
        pq.emplace(c, next_id, next_end);
      }
    }
  }
  if (!goal) return std::nullopt;

  std::vector<RoadId> path;
  for (std::size_t node = *goal; node != n; node = prev[node]) {
    path.push_back(static_cast<RoadId>(node / 2));
  }
  std::reverse(path.begin(), path.end());
  return path;
}

void Map::apply_edit_(const MapEdit& e) {
  if (e.road >= roads_.size()) {
    throw ConfigError("edit " + std::string(to_string(e.kind)) + ": no road " +
                      std::to_string(e.road) + " in " + name_);
  }
  Road& r = roads_[e.road];
  switch (e.kind) {
    case EditKind::AddBikeLane: r.bike_lane = true; break;
    case EditKind::AddBusLane:  r.bus_lane = true; break;
    case EditKind::CloseRoad:   r.closed = true; break;
    case EditKind::SetLanes:
      if (e.value < 1 || e.value > 8) {
        throw ConfigError("set_lanes on road " + std::to_string(e.road) + ": need 1..8 lanes");
      }
      r.lanes = static_cast<int>(e.value);
      break;
    case EditKind::SetSpeedLimit:
      if (e.value < 1 || e.value > 130) {
        throw ConfigError("set_speed_limit on road " + std::to_string(e.road) + ": need 1..130 km/h");
      }
      r.speed_limit_mm_s = kmh_to_mm_s(e.value);
      break;
  }
}

void Map::apply_edits(const MapEdits& edits) {
  for (const auto& e : edits.commands) {
    apply_edit_(e);
    edits_.commands.push_back(e);
  }
  if (!edits.empty()) edits_.name = edits.name;
}

void Map::apply_map_fixes() {
  if (fixes_applied_) return;
  for (const auto& e : fixes_.commands) apply_edit_(e);
  fixes_applied_ = true;
}

static std::vector<GridSpec> make_catalog_builtin() {
  GridSpec montlake;
  montlake.name = "montlake";
  montlake.cols = 4;
  montlake.rows = 4;
  montlake.block_mm = 400000;
  montlake.speed_limit_kmh = 40;
  montlake.row_streets = {"E Shelby St", "E Hamlin St", "E Roanoke St", "E Louisa St"};
  montlake.col_streets = {"Boyer Ave E", "Montlake Blvd E", "24th Ave E", "26th Ave E"};
  montlake.bike_lane_rows = {1};
  montlake.bus_route_col = 1;
  // Horizontal roads come first (4 rows * 3), so Montlake Blvd E is roads 15..17.
  // The raw data has it as one lane at 40 km/h; it's two lanes at 50.
  montlake.fixes.commands = {
    {15, EditKind::SetLanes, 2}, {16, EditKind::SetLanes, 2}, {17, EditKind::SetLanes, 2},
    {15, EditKind::SetSpeedLimit, 50}, {16, EditKind::SetSpeedLimit, 50},
    {17, EditKind::SetSpeedLimit, 50},
  };

  GridSpec twenty_third;
  twenty_third.name = "23rd";
  twenty_third.cols = 3;
  twenty_third.rows = 6;
  twenty_third.block_mm = 300000;
  twenty_third.speed_limit_kmh = 40;
  twenty_third.row_streets = {"E John St", "E Thomas St", "E Harrison St", "E Republican St",
                              "E Mercer St", "E Roy St"};
  twenty_third.col_streets = {"22nd Ave E", "23rd Ave E", "24th Ave E"};
  twenty_third.bike_lane_rows = {};
  twenty_third.bus_route_col = 1;
  // Horizontal roads come first (6 rows * 2), so 23rd Ave E is roads 17..21.
  twenty_third.fixes.commands = {
    {17, EditKind::SetSpeedLimit, 50}, {18, EditKind::SetSpeedLimit, 50},
    {19, EditKind::SetSpeedLimit, 50}, {20, EditKind::SetSpeedLimit, 50},
    {21, EditKind::SetSpeedLimit, 50},
  };
  return {montlake, twenty_third};
}

static const std::vector<GridSpec>& catalog() {
  static const std::vector<GridSpec> cat = make_catalog_builtin();
  return cat;
}

const std::vector<std::string>& map_names() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> out;
    for (const auto& g : catalog()) out.push_back(g.name);
    return out;
  }();
  return names;
}

std::optional<Map> map_by_name(const std::string& name, bool use_map_fixes) {
  auto it = std::find_if(catalog().begin(), catalog().end(),
                         [&](const GridSpec& g){ return g.name == name; });
  if (it == catalog().end()) return std::nullopt;
  Map m = Map::from_grid(*it);
  if (use_map_fixes) m.apply_map_fixes();
  return m;
}

} // namespace tsim
