#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <tsim/edits.hpp>
#include <tsim/paths.hpp>
#include <tsim/sim.hpp>
#include <tsim/timer.hpp>

namespace tsim {

// Everything needed to start a run. Read once by open_run(), never mutated after.
struct SimFlags {
  std::string load;                        // map, scenario or savestate path
  bool use_map_fixes = true;
  std::optional<std::uint64_t> rng_seed;   // nullopt seeds from entropy, loudly
  MapEdits edits;                          // ignored for savestates
  SimOptions opts;                         // savestates keep their own, with a warning

  // Builds a fresh map + engine. Scenarios have their trips scheduled; bare
  // maps start empty. Throws LoadError or ConfigError.
  LoadedRun open_run(Timer& timer) const;
  LoadKind kind() const { return classify_load_path(load); }
};

} // namespace tsim
