#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>
#include <tsim/clock.hpp>

namespace tsim {

using AgentId = std::uint32_t;
using BuildingId = std::uint32_t;

enum class TripMode : int {
  Walk = 0,
  Bike = 1,
  Transit = 2,
  Drive = 3,
};

inline constexpr std::array<TripMode, 4> kAllTripModes{
  TripMode::Walk, TripMode::Bike, TripMode::Transit, TripMode::Drive};

const char* to_string(TripMode m);
std::optional<TripMode> trip_mode_from_string(std::string_view s);

// One requested trip, as produced by a scenario or the spawner.
struct TripSpec {
  Clock depart;
  BuildingId origin = 0;
  BuildingId destination = 0;
  TripMode mode = TripMode::Walk;

  bool operator==(const TripSpec&) const = default;
};

// Emitted once when a trip completes.
struct TripRecord {
  AgentId agent = 0;
  TripMode mode = TripMode::Walk;
  Duration duration;

  bool operator==(const TripRecord&) const = default;
};

// Append-only history of one run's finished trips, in completion order.
class TripLedger {
public:
  void record(const TripRecord& trip) { trips_.push_back(trip); }
  const std::vector<TripRecord>& all() const { return trips_; }
  std::size_t size() const { return trips_.size(); }
  bool empty() const { return trips_.empty(); }

  bool operator==(const TripLedger&) const = default;

private:
  std::vector<TripRecord> trips_;
};

} // namespace tsim
