#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <tsim/clock.hpp>
#include <tsim/trip.hpp>

namespace tsim {

// Summary of a set of durations. Percentiles use the nearest-rank method.
struct DurationStats {
  std::uint64_t count = 0;
  Duration min;
  Duration p50;
  Duration p90;
  Duration p99;
  Duration max;
  Duration mean;    // truncated to whole ticks

  bool operator==(const DurationStats&) const = default;
};

// Order of add() calls never affects to_stats().
class DurationHistogram {
public:
  void add(Duration d) { samples_.push_back(d); }
  std::size_t count() const { return samples_.size(); }
  bool empty() const { return samples_.empty(); }
  // nullopt when nothing was added.
  std::optional<DurationStats> to_stats() const;

private:
  std::vector<Duration> samples_;
};

// Modes with no finished trips are absent, so an empty ledger gives an empty map.
std::map<TripMode, DurationStats> from_ledger(const TripLedger& ledger);

// One bus trip between consecutive stops of a route.
struct BusLeg {
  std::string route;
  std::uint32_t from_stop = 0;
  std::uint32_t to_stop = 0;
  Duration duration;

  bool operator==(const BusLeg&) const = default;
};

// Inter-stop times per route (mean = average time between stops); routes
// with no legs are absent.
std::map<std::string, DurationStats> bus_route_stats(const std::vector<BusLeg>& legs);

} // namespace tsim
