#pragma once
#include <cstdint>
#include <deque>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>
#include <tsim/clock.hpp>
#include <tsim/map.hpp>
#include <tsim/rng.hpp>
#include <tsim/scenario.hpp>
#include <tsim/stats.hpp>
#include <tsim/trip.hpp>

namespace tsim {

using BusId = std::uint32_t;

// Named run options, fixed for the lifetime of a run.
struct SimOptions {
  std::string run_name = "unnamed";   // savestates are filed under this name
  Duration step = Duration::from_ticks(kTicksPerSecond);
  std::string data_dir = "data";

  bool operator==(const SimOptions&) const = default;
};

// Free-flow speeds (mm/s) before per-agent variation.
inline constexpr std::int64_t kWalkSpeed = 1400;
inline constexpr std::int64_t kBikeSpeed = 3000;
inline constexpr std::int64_t kBikeLaneSpeed = 5500;
inline constexpr std::int64_t kCarMaxSpeed = 15000;
inline constexpr std::int64_t kBusMaxSpeed = 12000;
inline constexpr std::int64_t kBusesPerRoute = 3;
inline constexpr std::int64_t kBusDwellTicks = 20 * kTicksPerSecond;
inline constexpr std::int64_t kVehicleSpacingMm = 8000;

// Deterministic, integer-only traffic engine. All agents are processed in id
// order and every random draw goes through the engine's own stream, so a run
// is fully determined by its map, demand and seed.
class TrafficSim {
public:
  TrafficSim(const Map& map, RandomStream rng, SimOptions opts);

  // Queue a trip; the returned id is the one its TripRecord will carry.
  // Throws ConfigError for buildings the map doesn't have.
  AgentId schedule_trip(const Map& map, const TripSpec& trip);
  void schedule_scenario(const Map& map, const Scenario& scenario);

  // Advance by exactly `dt`. Trips finishing during the step complete at its end.
  void step(const Map& map, Duration dt);

  Clock time() const { return time_; }
  // Nothing left to depart and nobody travelling. Buses don't count.
  bool is_done() const { return pending_.empty() && agents_.empty(); }

  const TripLedger& finished_trips() const { return finished_; }
  const std::vector<BusLeg>& bus_legs() const { return bus_legs_; }
  std::size_t pending_trips() const { return pending_.size(); }
  std::size_t active_trips() const { return agents_.size(); }
  std::size_t aborted_trips() const { return aborted_; }
  std::size_t bus_count() const { return buses_.size(); }

  // Time lost to congestion, summed over all travellers.
  Duration total_delay() const { return Duration::from_ticks(delay_milliticks_ / 1000); }
  // Delay plus one hour per trip that couldn't be routed.
  Duration badness() const;

  RandomStream& rng() { return rng_; }
  const RandomStream& rng() const { return rng_; }
  const SimOptions& options() const { return opts_; }

  // Text serialization of the full engine state (sim_state.cpp).
  void write_state(std::ostream& out) const;
  // `map` must be the map the state was written against.
  static std::optional<TrafficSim> read_state(std::istream& in, const Map& map);

private:
  enum class Phase : int { Moving = 0, WaitingForBus = 1, Riding = 2 };
  enum class Mover : int { Walker, Cyclist, Car, Bus };

  struct Pending {
    AgentId id = 0;
    TripSpec trip;
  };

  struct Agent {
    AgentId id = 0;
    TripSpec trip;
    Phase phase = Phase::Moving;
    std::int64_t speed_permille = 1000;
    std::uint32_t route = 0;        // transit only: index into routes_
    std::uint32_t board_stop = 0;
    std::uint32_t alight_stop = 0;
    BusId bus = 0;                  // valid while Riding
    std::vector<RoadId> path;
    std::uint32_t path_idx = 0;
    std::int64_t offset_mm = 0;
    bool arrived = false;
  };

  struct Bus {
    BusId id = 0;
    std::uint32_t route = 0;
    std::uint32_t next_stop = 0;
    std::uint32_t path_idx = 0;
    std::int64_t offset_mm = 0;
    std::int64_t dwell_ticks = 0;
    Clock left_stop_at;
  };

  // Derived from the map; never serialized.
  struct RouteLegs {
    std::string name;
    std::vector<RoadId> stops;
    std::vector<std::vector<RoadId>> legs;   // legs[i]: stop i -> stop i+1, excluding stop i's road
    bool viable = false;
  };

  void build_routes_(const Map& map);
  void spawn_buses_();
  void start_departures_(const Map& map);
  void count_occupancy_(const Map& map);
  void move_buses_(const Map& map, Duration dt, Clock end);
  void move_agents_(const Map& map, Duration dt, Clock end);
  void finish_(const Agent& a, Clock end);

  struct Speeds { std::int64_t actual; std::int64_t free; };
  Speeds speeds_(const Road& road, Mover who, std::int64_t permille) const;
  // Moves along `path` for `ticks`. Returns unused ticks on reaching the end.
  std::optional<std::int64_t> advance_(const Map& map, const std::vector<RoadId>& path,
                                       std::uint32_t& idx, std::int64_t& offset_mm,
                                       std::int64_t ticks, Mover who,
                                       std::int64_t permille, bool count_delay);
  static Mover mover_for(TripMode mode);

  SimOptions opts_;
  RandomStream rng_;
  Clock time_;
  AgentId next_agent_ = 0;
  std::deque<Pending> pending_;     // sorted by (depart, id)
  std::vector<Agent> agents_;       // sorted by id
  std::vector<Bus> buses_;          // sorted by id
  std::vector<RouteLegs> routes_;
  std::vector<std::int64_t> occupancy_;
  TripLedger finished_;
  std::vector<BusLeg> bus_legs_;
  std::int64_t delay_milliticks_ = 0;
  std::size_t aborted_ = 0;
};

// A map together with the engine running on it. Each load produces a fresh
// pair; nothing is shared between runs.
struct LoadedRun {
  Map map;
  TrafficSim sim;
};

} // namespace tsim
