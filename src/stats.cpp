#include <tsim/stats.hpp>
#include <algorithm>

namespace tsim {

// Nearest rank: smallest value with at least pct% of samples at or below it.
static Duration percentile(const std::vector<Duration>& sorted, std::uint64_t pct) {
  const std::uint64_t n = sorted.size();
  std::uint64_t rank = (pct * n + 99) / 100;
  if (rank == 0) rank = 1;
  return sorted[static_cast<std::size_t>(rank - 1)];
}

std::optional<DurationStats> DurationHistogram::to_stats() const {
  if (samples_.empty()) return std::nullopt;
  std::vector<Duration> sorted = samples_;
  std::sort(sorted.begin(), sorted.end());

  std::int64_t sum = 0;
  for (const auto& d : sorted) sum += d.ticks();

  DurationStats s;
  s.count = sorted.size();
  s.min = sorted.front();
  s.max = sorted.back();
  s.p50 = percentile(sorted, 50);
  s.p90 = percentile(sorted, 90);
  s.p99 = percentile(sorted, 99);
  s.mean = Duration::from_ticks(sum / static_cast<std::int64_t>(sorted.size()));
  return s;
}

std::map<TripMode, DurationStats> from_ledger(const TripLedger& ledger) {
  std::map<TripMode, DurationHistogram> distribs;
  for (const auto& trip : ledger.all()) {
    distribs[trip.mode].add(trip.duration);
  }
  std::map<TripMode, DurationStats> out;
  for (const auto& [mode, hist] : distribs) {
    if (auto stats = hist.to_stats()) out.emplace(mode, *stats);
  }
  return out;
}

std::map<std::string, DurationStats> bus_route_stats(const std::vector<BusLeg>& legs) {
  std::map<std::string, DurationHistogram> distribs;
  for (const auto& leg : legs) {
    distribs[leg.route].add(leg.duration);
  }
  std::map<std::string, DurationStats> out;
  for (const auto& [route, hist] : distribs) {
    if (auto stats = hist.to_stats()) out.emplace(route, *stats);
  }
  return out;
}

} // namespace tsim
