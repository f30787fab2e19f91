#include <tsim/challenges.hpp>
#include <algorithm>
#include <tsim/overloaded.hpp>

namespace tsim {

static std::vector<Challenge> make_catalog_builtin() {
  return {
    {
      "Speed up route 48 (just Montlake area)",
      "Decrease the average waiting time between all of route 48's stops by at least 30s",
      "montlake",
      OptimizeBus{"48"},
      ReduceAverageWaitBy{"48", Duration::seconds(30)},
    },
    {
      "Speed up route 48 (larger section)",
      "Decrease the average waiting time between all of 48's stops by at least 30s",
      "23rd",
      OptimizeBus{"48"},
      ReduceAverageWaitBy{"48", Duration::seconds(30)},
    },
    {
      "Gridlock all of the everything",
      "Make traffic as BAD as possible!",
      "montlake",
      CreateGridlock{},
      IncreaseBadnessAbove{Duration::hours(kGridlockBadnessHours)},
    },
    {
      "Speed up all bike trips",
      "Reduce the 50%ile trip times of bikes by at least 1 minute",
      "montlake",
      FasterTrips{TripMode::Bike},
      ReduceMedianBy{TripMode::Bike, Duration::minutes(1)},
    },
    {
      "Speed up all car trips",
      "Reduce the 50%ile trip times of drivers by at least 5 minutes",
      "montlake",
      FasterTrips{TripMode::Drive},
      ReduceMedianBy{TripMode::Drive, Duration::minutes(5)},
    },
  };
}

const std::vector<Challenge>& all_challenges() {
  static const std::vector<Challenge> cat = make_catalog_builtin();
  return cat;
}

std::optional<Challenge> challenge_by_title(const std::string& title) {
  const auto& cat = all_challenges();
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Challenge& c){ return c.title == title; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::string describe(const GameplayMode& mode) {
  return std::visit(overloaded{
    [](const OptimizeBus& m) { return "optimize bus route " + m.route; },
    [](const CreateGridlock&) { return std::string("create gridlock"); },
    [](const FasterTrips& m) { return std::string("faster ") + to_string(m.mode) + " trips"; },
  }, mode);
}

std::string describe(const Goal& goal) {
  return std::visit(overloaded{
    [](const ReduceMedianBy& g) {
      return std::string("reduce median ") + to_string(g.mode) + " trip time by " + g.by.to_string();
    },
    [](const ReduceAverageWaitBy& g) {
      return "reduce average time between route " + g.route + " stops by " + g.by.to_string();
    },
    [](const IncreaseBadnessAbove& g) {
      return "push badness above " + g.threshold.to_string();
    },
  }, goal);
}

} // namespace tsim
