#include <tsim/trip.hpp>

namespace tsim {

const char* to_string(TripMode m) {
  switch (m) {
    case TripMode::Walk:    return "Walk";
    case TripMode::Bike:    return "Bike";
    case TripMode::Transit: return "Transit";
    case TripMode::Drive:   return "Drive";
  }
  return "Unknown";
}

std::optional<TripMode> trip_mode_from_string(std::string_view s) {
  for (TripMode m : kAllTripModes) {
    if (s == to_string(m)) return m;
  }
  return std::nullopt;
}

} // namespace tsim
