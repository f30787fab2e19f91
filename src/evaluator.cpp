#include <tsim/evaluator.hpp>
#include <spdlog/spdlog.h>
#include <tsim/errors.hpp>
#include <tsim/overloaded.hpp>
#include <tsim/paths.hpp>

namespace tsim {

static const RunResults& baseline_for(const Challenge& c, const PrebakedResults& baseline) {
  const RunResults* base = baseline.for_map(c.map_name);
  if (!base) throw ChallengeError("no prebaked results for " + c.map_name + "; run tsim_prebake first");
  return *base;
}

static void require_gameplay(const Challenge& c, bool ok) {
  if (!ok) {
    throw ChallengeError("challenge '" + c.title + "': goal '" + describe(c.goal) +
                         "' doesn't fit gameplay '" + describe(c.gameplay) + "'");
  }
}

static Verdict compare(Duration now, Duration before, Duration by, const std::string& what) {
  const Duration target = before - by;
  const bool ok = now <= target;
  return Verdict{ok, what + " went from " + before.to_string() + " to " + now.to_string() +
                     " (need " + target.to_string() + " or less)"};
}

Verdict evaluate(const Challenge& challenge, const RunResults& current,
                 const PrebakedResults& baseline) {
  return std::visit(overloaded{
    [&](const ReduceMedianBy& g) {
      const auto* fast = std::get_if<FasterTrips>(&challenge.gameplay);
      require_gameplay(challenge, fast && fast->mode == g.mode);
      const RunResults& base = baseline_for(challenge, baseline);
      auto b = base.faster_trips.find(g.mode);
      if (b == base.faster_trips.end()) {
        throw ChallengeError(std::string("baseline for ") + challenge.map_name + " has no " +
                             to_string(g.mode) + " trips");
      }
      auto c = current.faster_trips.find(g.mode);
      if (c == current.faster_trips.end()) {
        return Verdict{false, std::string("no ") + to_string(g.mode) + " trips finished"};
      }
      return compare(c->second.p50, b->second.p50, g.by,
                     std::string("median ") + to_string(g.mode) + " trip time");
    },
    [&](const ReduceAverageWaitBy& g) {
      const auto* bus = std::get_if<OptimizeBus>(&challenge.gameplay);
      require_gameplay(challenge, bus && bus->route == g.route);
      const RunResults& base = baseline_for(challenge, baseline);
      auto b = base.bus_routes.find(g.route);
      if (b == base.bus_routes.end()) {
        throw ChallengeError("baseline for " + challenge.map_name + " has no route " + g.route);
      }
      auto c = current.bus_routes.find(g.route);
      if (c == current.bus_routes.end()) {
        return Verdict{false, "route " + g.route + " never reached a stop"};
      }
      return compare(c->second.mean, b->second.mean, g.by,
                     "average time between route " + g.route + " stops");
    },
    [&](const IncreaseBadnessAbove& g) {
      require_gameplay(challenge, std::holds_alternative<CreateGridlock>(challenge.gameplay));
      const bool ok = current.badness > g.threshold;
      return Verdict{ok, "badness " + current.badness.to_string() + " (need more than " +
                             g.threshold.to_string() + ")"};
    },
  }, challenge.goal);
}

ChallengeRun run_challenge(const Challenge& challenge, const MapEdits& edits,
                           std::optional<std::uint64_t> seed, const std::string& data_dir,
                           Timer& timer) {
  if (!seed) throw ConfigError("challenge runs need an explicit RNG seed");

  // Gridlock needs no baseline, so a missing file only matters once evaluate() looks.
  const std::string path = path_prebaked_results(data_dir);
  const PrebakedResults baseline = load_prebaked_results(path).value_or(PrebakedResults{});
  if (const RunResults* base = baseline.for_map(challenge.map_name)) {
    if (!base->seed) {
      spdlog::warn("{} doesn't record the seed {} was prebaked with", path, challenge.map_name);
    } else if (*base->seed != *seed) {
      throw ConfigError("baseline for " + challenge.map_name + " was prebaked with seed " +
                        std::to_string(*base->seed) + ", not " + std::to_string(*seed));
    }
  }

  timer.start("challenge " + challenge.title);
  ChallengeRun out;
  out.results = run_reference(challenge.map_name, kReferenceScenario, *seed, edits, data_dir, timer);
  out.verdict = evaluate(challenge, out.results, baseline);
  timer.stop("challenge " + challenge.title);

  spdlog::info("{}: {} ({})", challenge.title, out.verdict.passed ? "passed" : "failed",
               out.verdict.reason);
  return out;
}

} // namespace tsim
