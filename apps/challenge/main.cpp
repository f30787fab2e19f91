#include <iostream>
#include <spdlog/spdlog.h>
#include <tsim/challenges.hpp>
#include <tsim/cli.hpp>
#include <tsim/errors.hpp>
#include <tsim/evaluator.hpp>
#include <tsim/log.hpp>

using namespace tsim;

static void list() {
  const auto& all = all_challenges();
  for (std::size_t i = 0; i < all.size(); ++i) {
    const Challenge& c = all[i];
    std::cout << i << ". " << c.title << " [" << c.map_name << "]\n"
              << "   " << c.description << "\n"
              << "   " << describe(c.gameplay) << "; " << describe(c.goal) << "\n";
  }
}

int main(int argc, char** argv) {
  const std::vector<std::string> args(argv + 1, argv + argc);
  ChallengeArgs a;
  try {
    a = parse_challenge_args(args);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n" << challenge_usage();
    return 2;
  }
  init_logging("tsim_challenge", a.verbose);

  if (a.command == ChallengeCommand::List) {
    list();
    return 0;
  }

  try {
    const Challenge& c = all_challenges().at(a.index);
    const MapEdits edits = a.edits_path ? read_edits_file(*a.edits_path) : MapEdits{};
    Timer timer("challenge");
    const ChallengeRun run = run_challenge(c, edits, a.rng_seed, a.data_dir, timer);
    std::cout << (run.verdict.passed ? "PASS" : "FAIL") << ": " << c.title << "\n"
              << "  " << run.verdict.reason << "\n";
    return run.verdict.passed ? 0 : 3;
  } catch (const ConfigError& e) {
    spdlog::error("{}", e.what());
    return 2;
  } catch (const Error& e) {
    spdlog::error("{}", e.what());
    return 1;
  }
}
