#include <tsim/sim.hpp>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <tsim/errors.hpp>

namespace tsim {

TrafficSim::TrafficSim(const Map& map, RandomStream rng, SimOptions opts)
  : opts_(std::move(opts)), rng_(std::move(rng)) {
  build_routes_(map);
  spawn_buses_();
}

void TrafficSim::build_routes_(const Map& map) {
  routes_.clear();
  for (const auto& route : map.bus_routes()) {
    RouteLegs rl;
    rl.name = route.name;
    rl.stops = route.stops;
    rl.viable = route.stops.size() >= 2;
    for (std::size_t i = 0; rl.viable && i < route.stops.size(); ++i) {
      auto path = map.pathfind(route.stops[i], route.stops[(i + 1) % route.stops.size()]);
      if (!path) {
        spdlog::warn("bus route {} can't get from stop {} to the next; not running it", route.name, i);
        rl.viable = false;
        break;
      }
      path->erase(path->begin());
      rl.legs.push_back(std::move(*path));
    }
    routes_.push_back(std::move(rl));
  }
}

void TrafficSim::spawn_buses_() {
  buses_.clear();
  BusId next = 0;
  for (std::uint32_t r = 0; r < routes_.size(); ++r) {
    if (!routes_[r].viable) continue;
    const auto n = static_cast<std::int64_t>(routes_[r].stops.size());
    for (std::int64_t k = 0; k < kBusesPerRoute; ++k) {
      Bus b;
      b.id = next++;
      b.route = r;
      b.next_stop = static_cast<std::uint32_t>((k * n / kBusesPerRoute + 1) % n);
      b.left_stop_at = time_;
      buses_.push_back(b);
    }
  }
}

AgentId TrafficSim::schedule_trip(const Map& map, const TripSpec& trip) {
  const auto n = map.buildings().size();
  if (trip.origin >= n || trip.destination >= n) {
    throw ConfigError("trip at " + trip.depart.format() + " uses a building " + map.name() +
                      " doesn't have");
  }
  const AgentId id = next_agent_++;
  auto it = std::upper_bound(pending_.begin(), pending_.end(), trip.depart,
                             [](Clock t, const Pending& p){ return t < p.trip.depart; });
  pending_.insert(it, Pending{id, trip});
  return id;
}

void TrafficSim::schedule_scenario(const Map& map, const Scenario& scenario) {
  validate_scenario(scenario, map);
  for (const auto& t : scenario.trips) schedule_trip(map, t);
  spdlog::info("scheduled {} trips from scenario {}", scenario.trips.size(), scenario.name);
}

Duration TrafficSim::badness() const {
  return total_delay() + Duration::hours(static_cast<std::int64_t>(aborted_));
}

TrafficSim::Mover TrafficSim::mover_for(TripMode mode) {
  switch (mode) {
    case TripMode::Walk:    return Mover::Walker;
    case TripMode::Bike:    return Mover::Cyclist;
    case TripMode::Transit: return Mover::Walker;
    case TripMode::Drive:   return Mover::Car;
  }
  return Mover::Walker;
}

void TrafficSim::step(const Map& map, Duration dt) {
  if (dt <= Duration::zero()) return;
  const Clock end = time_ + dt;
  start_departures_(map);
  count_occupancy_(map);
  move_buses_(map, dt, end);
  move_agents_(map, dt, end);
  agents_.erase(std::remove_if(agents_.begin(), agents_.end(),
                               [](const Agent& a){ return a.arrived; }),
                agents_.end());
  time_ = end;
}

void TrafficSim::start_departures_(const Map& map) {
  while (!pending_.empty() && pending_.front().trip.depart <= time_) {
    const Pending p = pending_.front();
    pending_.pop_front();

    Agent a;
    a.id = p.id;
    a.trip = p.trip;
    // Drawn for every trip, aborted or not, so demand alone fixes the stream.
    a.speed_permille = rng_.uniform(900, 1101);

    const RoadId from = map.building(p.trip.origin).road;
    const RoadId to = map.building(p.trip.destination).road;

    if (p.trip.mode == TripMode::Transit) {
      bool found = false;
      for (std::uint32_t r = 0; r < routes_.size() && !found; ++r) {
        if (!routes_[r].viable) continue;
        const auto& stops = routes_[r].stops;
        auto board = std::find(stops.begin(), stops.end(), from);
        auto alight = std::find(stops.begin(), stops.end(), to);
        if (board == stops.end() || alight == stops.end() || board == alight) continue;
        a.phase = Phase::WaitingForBus;
        a.route = r;
        a.board_stop = static_cast<std::uint32_t>(board - stops.begin());
        a.alight_stop = static_cast<std::uint32_t>(alight - stops.begin());
        found = true;
      }
      if (!found) {
        ++aborted_;
        spdlog::debug("agent {}: no bus connects building {} to {}; aborting", a.id,
                      p.trip.origin, p.trip.destination);
        continue;
      }
    } else {
      auto path = map.pathfind(from, to);
      if (!path) {
        ++aborted_;
        spdlog::debug("agent {}: no {} route from building {} to {}; aborting", a.id,
                      to_string(p.trip.mode), p.trip.origin, p.trip.destination);
        continue;
      }
      a.phase = Phase::Moving;
      a.path = std::move(*path);
    }
    agents_.push_back(std::move(a));
  }
}

void TrafficSim::count_occupancy_(const Map& map) {
  occupancy_.assign(map.roads().size(), 0);
  for (const auto& a : agents_) {
    if (a.phase != Phase::Moving || a.path_idx >= a.path.size()) continue;
    const Road& road = map.road(a.path[a.path_idx]);
    if (a.trip.mode == TripMode::Drive ||
        (a.trip.mode == TripMode::Bike && !road.bike_lane)) {
      ++occupancy_[road.id];
    }
  }
  for (const auto& b : buses_) {
    if (b.dwell_ticks > 0) continue;
    const auto& route = routes_[b.route];
    const std::uint32_t prev = (b.next_stop + route.stops.size() - 1) % route.stops.size();
    const auto& leg = route.legs[prev];
    if (b.path_idx >= leg.size()) continue;
    const Road& road = map.road(leg[b.path_idx]);
    if (!road.bus_lane) ++occupancy_[road.id];
  }
}

TrafficSim::Speeds TrafficSim::speeds_(const Road& road, Mover who, std::int64_t permille) const {
  std::int64_t base = 0;
  bool shares_traffic = true;
  switch (who) {
    case Mover::Walker:
      base = kWalkSpeed;
      shares_traffic = false;
      break;
    case Mover::Cyclist:
      base = road.bike_lane ? kBikeLaneSpeed : kBikeSpeed;
      shares_traffic = !road.bike_lane;
      break;
    case Mover::Car:
      base = std::min(road.speed_limit_mm_s, kCarMaxSpeed);
      break;
    case Mover::Bus:
      base = std::min(road.speed_limit_mm_s, kBusMaxSpeed);
      shares_traffic = !road.bus_lane;
      break;
  }
  const std::int64_t free = std::max<std::int64_t>(1, base * permille / 1000);
  std::int64_t actual = free;
  if (shares_traffic) {
    const std::int64_t capacity = std::max<std::int64_t>(1, road.lanes * road.length_mm / kVehicleSpacingMm);
    const std::int64_t occ = road.id < occupancy_.size() ? occupancy_[road.id] : 0;
    if (occ > capacity) {
      actual = std::max<std::int64_t>({free * capacity / occ, free / 10, 1});
    }
  }
  return Speeds{actual, free};
}

std::optional<std::int64_t> TrafficSim::advance_(const Map& map, const std::vector<RoadId>& path,
                                                 std::uint32_t& idx, std::int64_t& offset_mm,
                                                 std::int64_t ticks, Mover who,
                                                 std::int64_t permille, bool count_delay) {
  std::int64_t left = ticks;
  while (idx < path.size()) {
    const Road& road = map.road(path[idx]);
    const Speeds v = speeds_(road, who, permille);
    const std::int64_t remaining_mm = road.length_mm - offset_mm;
    const std::int64_t reach_mm = v.actual * left / kTicksPerSecond;
    if (reach_mm < remaining_mm) {
      offset_mm += reach_mm;
      if (count_delay) delay_milliticks_ += left * 1000 * (v.free - v.actual) / v.free;
      return std::nullopt;
    }
    // Round up so a road is never finished early.
    std::int64_t used = (remaining_mm * kTicksPerSecond + v.actual - 1) / v.actual;
    if (used > left) used = left;
    if (count_delay) delay_milliticks_ += used * 1000 * (v.free - v.actual) / v.free;
    left -= used;
    ++idx;
    offset_mm = 0;
  }
  return left;
}

void TrafficSim::finish_(const Agent& a, Clock end) {
  finished_.record(TripRecord{a.id, a.trip.mode, end - a.trip.depart});
}

void TrafficSim::move_buses_(const Map& map, Duration dt, Clock end) {
  for (auto& b : buses_) {
    auto& route = routes_[b.route];
    const auto n_stops = static_cast<std::uint32_t>(route.stops.size());
    std::int64_t left = dt.ticks();

    while (left > 0) {
      if (b.dwell_ticks > 0) {
        const std::int64_t d = std::min(b.dwell_ticks, left);
        b.dwell_ticks -= d;
        left -= d;
        if (b.dwell_ticks == 0) b.left_stop_at = end + Duration::from_ticks(-left);
        continue;
      }

      const std::uint32_t prev = (b.next_stop + n_stops - 1) % n_stops;
      auto spare = advance_(map, route.legs[prev], b.path_idx, b.offset_mm, left,
                            Mover::Bus, 1000, false);
      if (!spare) break;
      left = *spare;

      const Clock arrived = end + Duration::from_ticks(-left);
      bus_legs_.push_back(BusLeg{route.name, prev, b.next_stop, arrived - b.left_stop_at});

      for (auto& a : agents_) {
        if (a.phase == Phase::Riding && a.bus == b.id && a.alight_stop == b.next_stop) {
          a.arrived = true;
          finish_(a, end);
        }
      }
      for (auto& a : agents_) {
        if (a.phase == Phase::WaitingForBus && a.route == b.route && a.board_stop == b.next_stop) {
          a.phase = Phase::Riding;
          a.bus = b.id;
        }
      }

      b.next_stop = (b.next_stop + 1) % n_stops;
      b.path_idx = 0;
      b.offset_mm = 0;
      b.dwell_ticks = kBusDwellTicks;
    }
  }
}

void TrafficSim::move_agents_(const Map& map, Duration dt, Clock end) {
  for (auto& a : agents_) {
    if (a.phase != Phase::Moving || a.arrived) continue;
    const Mover who = mover_for(a.trip.mode);
    auto spare = advance_(map, a.path, a.path_idx, a.offset_mm, dt.ticks(), who,
                          a.speed_permille, who != Mover::Walker);
    if (spare) {
      a.arrived = true;
      finish_(a, end);
    }
  }
}

} // namespace tsim
