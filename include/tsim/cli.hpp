#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <tsim/clock.hpp>
#include <tsim/edits.hpp>
#include <tsim/flags.hpp>
#include <tsim/spawner.hpp>

namespace tsim {

// Command-line parsing for the three tools. Flags take their value either as
// the next argument or after '='. Every parser throws ConfigError on unknown
// flags, missing values and unparsable values; nothing falls back to a default.

struct HeadlessArgs {
  SimFlags flags;                            // flags.opts.run_name = scenario name
  std::optional<Clock> save_at;
  std::optional<Duration> savestate_every;
  DemandProfile profile = DemandProfile::Small;   // demand spawned for bare maps
  std::optional<std::string> edits_path;
  bool verbose = false;
};

// tsim_headless <load> [--rng_seed N] [--save_at TIME] [--big_sim | --profile NAME]
//   [--scenario_name NAME] [--data_dir DIR] [--no_map_fixes]
//   [--savestate_every DURATION] [--edits FILE] [--verbose]
HeadlessArgs parse_headless_args(const std::vector<std::string>& args);

struct PrebakeArgs {
  std::optional<std::uint64_t> rng_seed;     // checked by prebake(), not here
  std::string data_dir = "data";
  bool verbose = false;
};

// tsim_prebake --rng_seed N [--data_dir DIR] [--verbose]
PrebakeArgs parse_prebake_args(const std::vector<std::string>& args);

enum class ChallengeCommand : int { List = 0, Run = 1 };

struct ChallengeArgs {
  ChallengeCommand command = ChallengeCommand::List;
  std::size_t index = 0;                     // into all_challenges(), for Run
  std::optional<std::uint64_t> rng_seed;
  std::optional<std::string> edits_path;
  std::string data_dir = "data";
  bool verbose = false;
};

// tsim_challenge list
// tsim_challenge run <index> --rng_seed N [--edits FILE] [--data_dir DIR] [--verbose]
ChallengeArgs parse_challenge_args(const std::vector<std::string>& args);

std::optional<std::uint64_t> parse_seed(const std::string& text);

// Edits named after the file stem. Throws LoadError if it can't be read and
// ConfigError for bad rows.
MapEdits read_edits_file(const std::string& path);

std::string headless_usage();
std::string prebake_usage();
std::string challenge_usage();

} // namespace tsim
