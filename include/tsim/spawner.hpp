#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <tsim/map.hpp>
#include <tsim/rng.hpp>
#include <tsim/scenario.hpp>

namespace tsim {

enum class DemandProfile : int {
  Small = 0,    // 50 trips in the first hour
  Big = 1,      // 1000 trips over the first four hours
  Weekday = 2,  // 10 trips per building, morning and evening peaks
};

const char* to_string(DemandProfile p);
std::optional<DemandProfile> demand_profile_from_string(std::string_view s);

// Trip requests for `map`, sorted by departure. Randomness comes only from
// `rng`, so the same stream state always yields the same demand. Maps with
// fewer than two buildings get no trips.
std::vector<TripSpec> spawn_demand(const Map& map, RandomStream& rng, DemandProfile profile);

// Scenarios that are generated rather than read from disk.
inline constexpr const char* kWeekdayScenario = "weekday_typical_traffic_from_psrc";
bool is_builtin_scenario(const std::string& name);
// nullopt for names that aren't built in.
std::optional<Scenario> instantiate_builtin_scenario(const std::string& name, const Map& map,
                                                     RandomStream& rng);

} // namespace tsim
