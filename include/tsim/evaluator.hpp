#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <tsim/challenges.hpp>
#include <tsim/edits.hpp>
#include <tsim/prebake.hpp>
#include <tsim/timer.hpp>

namespace tsim {

struct Verdict {
  bool passed = false;
  std::string reason;
};

// Scores one run against the baseline for the challenge's map. Throws
// ChallengeError when the goal doesn't fit the gameplay mode or a needed
// baseline is missing. Mode or route absent from `current` is a plain fail.
Verdict evaluate(const Challenge& challenge, const RunResults& current,
                 const PrebakedResults& baseline);

struct ChallengeRun {
  RunResults results;
  Verdict verdict;
};

// Replays the reference scenario on the challenge's map with `edits` applied
// and scores it against <data_dir>/prebaked_results.csv (which may be absent
// for goals that need no baseline). A missing seed, or one that differs from
// the seed the map's baseline was prebaked with, is a ConfigError.
ChallengeRun run_challenge(const Challenge& challenge, const MapEdits& edits,
                           std::optional<std::uint64_t> seed, const std::string& data_dir,
                           Timer& timer);

} // namespace tsim
