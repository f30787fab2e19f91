#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <tsim/clock.hpp>
#include <tsim/trip.hpp>

namespace tsim {

// What a challenge is about.
struct OptimizeBus { std::string route; bool operator==(const OptimizeBus&) const = default; };
struct CreateGridlock { bool operator==(const CreateGridlock&) const = default; };
struct FasterTrips { TripMode mode; bool operator==(const FasterTrips&) const = default; };
using GameplayMode = std::variant<OptimizeBus, CreateGridlock, FasterTrips>;

// How it is scored.
struct ReduceMedianBy {
  TripMode mode;
  Duration by;
  bool operator==(const ReduceMedianBy&) const = default;
};
struct ReduceAverageWaitBy {
  std::string route;
  Duration by;
  bool operator==(const ReduceAverageWaitBy&) const = default;
};
struct IncreaseBadnessAbove {
  Duration threshold;
  bool operator==(const IncreaseBadnessAbove&) const = default;
};
using Goal = std::variant<ReduceMedianBy, ReduceAverageWaitBy, IncreaseBadnessAbove>;

struct Challenge {
  std::string title;
  std::string description;
  std::string map_name;
  GameplayMode gameplay;
  Goal goal;
};

// The description of the gridlock challenge gives no number.
inline constexpr std::int64_t kGridlockBadnessHours = 100;

// Fixed catalog, in menu order.
const std::vector<Challenge>& all_challenges();
std::optional<Challenge> challenge_by_title(const std::string& title);

std::string describe(const GameplayMode& mode);
std::string describe(const Goal& goal);

} // namespace tsim
