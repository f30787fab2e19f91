#include <iostream>
#include <spdlog/spdlog.h>
#include <tsim/cli.hpp>
#include <tsim/errors.hpp>
#include <tsim/log.hpp>
#include <tsim/prebake.hpp>

using namespace tsim;

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  PrebakeArgs a;
  try {
    a = parse_prebake_args(args);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n" << prebake_usage();
    return 2;
  }
  init_logging("tsim_prebake", a.verbose);

  try {
    Timer timer("prebake");
    const PrebakedResults r = prebake_all(a.rng_seed, a.data_dir, timer);
    for (const auto& [map, res] : r.maps) {
      spdlog::info("{}: {} modes, {} bus routes, badness {}", map, res.faster_trips.size(),
                   res.bus_routes.size(), res.badness.to_string());
    }
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const Error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
  return 0;
}
