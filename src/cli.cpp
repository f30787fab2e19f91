#include <tsim/cli.hpp>
#include <tsim/challenges.hpp>
#include <tsim/csv.hpp>
#include <tsim/errors.hpp>

namespace tsim {

namespace {

// Walks argv, splitting "--flag=value" and fetching "--flag value".
class ArgCursor {
public:
  explicit ArgCursor(const std::vector<std::string>& args) : args_(args) {}

  bool done() const { return i_ >= args_.size(); }

  // Next raw argument; for flags, the part before any '='.
  std::string next() {
    const std::string& a = args_[i_++];
    inline_value_.reset();
    if (a.rfind("--", 0) == 0) {
      const auto eq = a.find('=');
      if (eq != std::string::npos) {
        inline_value_ = a.substr(eq + 1);
        return a.substr(0, eq);
      }
    }
    return a;
  }

  std::string value(const std::string& flag) {
    if (inline_value_) {
      std::string v = *inline_value_;
      inline_value_.reset();
      return v;
    }
    if (done()) throw ConfigError(flag + " needs a value");
    return args_[i_++];
  }

  void no_value(const std::string& flag) const {
    if (inline_value_) throw ConfigError(flag + " doesn't take a value");
  }

private:
  const std::vector<std::string>& args_;
  std::size_t i_ = 0;
  std::optional<std::string> inline_value_;
};

} // namespace

static bool is_flag(const std::string& a) {
  return a.size() > 2 && a.rfind("--", 0) == 0;
}

static std::uint64_t seed_value(ArgCursor& cur, const std::string& flag) {
  const std::string text = cur.value(flag);
  auto seed = parse_seed(text);
  if (!seed) throw ConfigError(flag + ": '" + text + "' isn't a non-negative integer");
  return *seed;
}

static std::string nonempty_value(ArgCursor& cur, const std::string& flag) {
  std::string v = cur.value(flag);
  if (v.empty()) throw ConfigError(flag + " can't be empty");
  return v;
}

std::optional<std::uint64_t> parse_seed(const std::string& text) {
  return csv::to_uint(csv::trim(text));
}

HeadlessArgs parse_headless_args(const std::vector<std::string>& args) {
  HeadlessArgs out;
  out.flags.opts.run_name = "headless";
  std::optional<std::string> load;
  std::optional<DemandProfile> profile;
  auto pick_profile = [&](DemandProfile p) {
    if (profile && *profile != p) {
      throw ConfigError(std::string("asked for both ") + to_string(*profile) + " and " +
                        to_string(p) + " demand");
    }
    profile = p;
    out.profile = p;
  };

  ArgCursor cur(args);
  while (!cur.done()) {
    const std::string a = cur.next();
    if (a == "--rng_seed") {
      out.flags.rng_seed = seed_value(cur, a);
    } else if (a == "--save_at") {
      const std::string text = cur.value(a);
      auto t = Clock::parse(text);
      if (!t) throw ConfigError("--save_at: couldn't parse time '" + text + "'");
      out.save_at = *t;
    } else if (a == "--savestate_every") {
      const std::string text = cur.value(a);
      auto d = Duration::parse(text);
      if (!d || *d <= Duration::zero()) {
        throw ConfigError("--savestate_every: need a positive duration, got '" + text + "'");
      }
      out.savestate_every = *d;
    } else if (a == "--big_sim") {
      cur.no_value(a);
      pick_profile(DemandProfile::Big);
    } else if (a == "--profile") {
      const std::string text = cur.value(a);
      auto p = demand_profile_from_string(text);
      if (!p) throw ConfigError("--profile: no demand profile named '" + text + "'");
      pick_profile(*p);
    } else if (a == "--scenario_name") {
      out.flags.opts.run_name = nonempty_value(cur, a);
    } else if (a == "--data_dir") {
      out.flags.opts.data_dir = nonempty_value(cur, a);
    } else if (a == "--no_map_fixes") {
      cur.no_value(a);
      out.flags.use_map_fixes = false;
    } else if (a == "--edits") {
      out.edits_path = nonempty_value(cur, a);
    } else if (a == "--verbose") {
      cur.no_value(a);
      out.verbose = true;
    } else if (is_flag(a)) {
      throw ConfigError("unknown flag " + a);
    } else if (load) {
      throw ConfigError("only one thing to load, got '" + *load + "' and '" + a + "'");
    } else {
      load = a;
    }
  }
  if (!load) throw ConfigError("nothing to load");
  out.flags.load = *load;
  return out;
}

PrebakeArgs parse_prebake_args(const std::vector<std::string>& args) {
  PrebakeArgs out;
  ArgCursor cur(args);
  while (!cur.done()) {
    const std::string a = cur.next();
    if (a == "--rng_seed") {
      out.rng_seed = seed_value(cur, a);
    } else if (a == "--data_dir") {
      out.data_dir = nonempty_value(cur, a);
    } else if (a == "--verbose") {
      cur.no_value(a);
      out.verbose = true;
    } else {
      throw ConfigError("unexpected argument " + a);
    }
  }
  return out;
}

ChallengeArgs parse_challenge_args(const std::vector<std::string>& args) {
  ChallengeArgs out;
  if (args.empty()) throw ConfigError("expected 'list' or 'run'");

  if (args[0] == "list") {
    if (args.size() > 1) throw ConfigError("'list' takes no arguments");
    out.command = ChallengeCommand::List;
    return out;
  }
  if (args[0] != "run") throw ConfigError("unknown command '" + args[0] + "'");
  out.command = ChallengeCommand::Run;

  const std::vector<std::string> rest(args.begin() + 1, args.end());
  std::optional<std::size_t> index;
  ArgCursor cur(rest);
  while (!cur.done()) {
    const std::string a = cur.next();
    if (a == "--rng_seed") {
      out.rng_seed = seed_value(cur, a);
    } else if (a == "--edits") {
      out.edits_path = nonempty_value(cur, a);
    } else if (a == "--data_dir") {
      out.data_dir = nonempty_value(cur, a);
    } else if (a == "--verbose") {
      cur.no_value(a);
      out.verbose = true;
    } else if (is_flag(a)) {
      throw ConfigError("unknown flag " + a);
    } else if (index) {
      throw ConfigError("one challenge at a time");
    } else {
      auto i = csv::to_int(a);
      const auto n = all_challenges().size();
      if (!i || *i < 0 || static_cast<std::size_t>(*i) >= n) {
        throw ConfigError("challenge index '" + a + "' is not in 0.." + std::to_string(n - 1));
      }
      index = static_cast<std::size_t>(*i);
    }
  }
  if (!index) throw ConfigError("'run' needs a challenge index");
  out.index = *index;
  return out;
}

MapEdits read_edits_file(const std::string& path) {
  auto edits = load_edits_csv(path);
  if (!edits) throw LoadError(path, "can't open edits file");
  return std::move(*edits);
}

std::string headless_usage() {
  return "usage: tsim_headless <load> [--rng_seed N] [--save_at TIME] [--big_sim | --profile NAME]\n"
         "                            [--scenario_name NAME] [--data_dir DIR] [--no_map_fixes]\n"
         "                            [--savestate_every DURATION] [--edits FILE] [--verbose]\n";
}

std::string prebake_usage() {
  return "usage: tsim_prebake --rng_seed N [--data_dir DIR] [--verbose]\n";
}

std::string challenge_usage() {
  return "usage: tsim_challenge list\n"
         "       tsim_challenge run <index> --rng_seed N [--edits FILE] [--data_dir DIR] [--verbose]\n";
}

} // namespace tsim
