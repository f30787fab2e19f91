#include <tsim/sim.hpp>
#include <iomanip>
#include <istream>
#include <ostream>

namespace tsim {

static void write_trip(std::ostream& out, const TripSpec& t) {
  out << t.depart.ticks() << ' ' << t.origin << ' ' << t.destination << ' '
      << static_cast<int>(t.mode);
}

static bool read_trip(std::istream& in, TripSpec& t) {
  std::int64_t depart = 0;
  int mode = 0;
  if (!(in >> depart >> t.origin >> t.destination >> mode)) return false;
  if (depart < 0 || mode < 0 || mode > static_cast<int>(TripMode::Drive)) return false;
  t.depart = Clock::from_ticks(depart);
  t.mode = static_cast<TripMode>(mode);
  return true;
}

static bool expect(std::istream& in, const char* key) {
  std::string word;
  return (in >> word) && word == key;
}

template <class T>
static bool read_field(std::istream& in, const char* key, T& out) {
  return expect(in, key) && static_cast<bool>(in >> out);
}

void TrafficSim::write_state(std::ostream& out) const {
  out << "time " << time_.ticks() << '\n';
  out << "run_name " << std::quoted(opts_.run_name) << '\n';
  out << "step " << opts_.step.ticks() << '\n';
  out << "data_dir " << std::quoted(opts_.data_dir) << '\n';
  out << "rng ";
  rng_.write_state(out);
  out << '\n';
  out << "next_agent " << next_agent_ << '\n';
  out << "delay_milliticks " << delay_milliticks_ << '\n';
  out << "aborted " << aborted_ << '\n';

  out << "pending " << pending_.size() << '\n';
  for (const auto& p : pending_) {
    out << p.id << ' ';
    write_trip(out, p.trip);
    out << '\n';
  }

  out << "agents " << agents_.size() << '\n';
  for (const auto& a : agents_) {
    out << a.id << ' ';
    write_trip(out, a.trip);
    out << ' ' << static_cast<int>(a.phase) << ' ' << a.speed_permille << ' ' << a.route << ' '
        << a.board_stop << ' ' << a.alight_stop << ' ' << a.bus << ' ' << a.path_idx << ' '
        << a.offset_mm << ' ' << a.path.size();
    for (RoadId r : a.path) out << ' ' << r;
    out << '\n';
  }

  out << "buses " << buses_.size() << '\n';
  for (const auto& b : buses_) {
    out << b.id << ' ' << b.route << ' ' << b.next_stop << ' ' << b.path_idx << ' '
        << b.offset_mm << ' ' << b.dwell_ticks << ' ' << b.left_stop_at.ticks() << '\n';
  }

  out << "finished " << finished_.size() << '\n';
  for (const auto& t : finished_.all()) {
    out << t.agent << ' ' << static_cast<int>(t.mode) << ' ' << t.duration.ticks() << '\n';
  }

  out << "bus_legs " << bus_legs_.size() << '\n';
  for (const auto& l : bus_legs_) {
    out << std::quoted(l.route) << ' ' << l.from_stop << ' ' << l.to_stop << ' '
        << l.duration.ticks() << '\n';
  }
  out << "end\n";
}

std::optional<TrafficSim> TrafficSim::read_state(std::istream& in, const Map& map) {
  std::int64_t time = 0, step = 0;
  SimOptions opts;
  if (!read_field(in, "time", time) || time < 0) return std::nullopt;
  if (!expect(in, "run_name") || !(in >> std::quoted(opts.run_name))) return std::nullopt;
  if (!read_field(in, "step", step) || step <= 0) return std::nullopt;
  opts.step = Duration::from_ticks(step);
  if (!expect(in, "data_dir") || !(in >> std::quoted(opts.data_dir))) return std::nullopt;

  RandomStream rng = RandomStream::seeded(0);
  if (!expect(in, "rng") || !rng.read_state(in)) return std::nullopt;

  TrafficSim sim(map, std::move(rng), std::move(opts));
  sim.time_ = Clock::from_ticks(time);
  if (!read_field(in, "next_agent", sim.next_agent_)) return std::nullopt;
  if (!read_field(in, "delay_milliticks", sim.delay_milliticks_)) return std::nullopt;
  if (!read_field(in, "aborted", sim.aborted_)) return std::nullopt;

  const auto n_roads = map.roads().size();
  const auto n_bldgs = map.buildings().size();
  auto trip_ok = [&](const TripSpec& t) { return t.origin < n_bldgs && t.destination < n_bldgs; };

  std::size_t count = 0;
  if (!read_field(in, "pending", count)) return std::nullopt;
  for (std::size_t i = 0; i < count; ++i) {
    Pending p;
    if (!(in >> p.id) || !read_trip(in, p.trip) || !trip_ok(p.trip)) return std::nullopt;
    sim.pending_.push_back(p);
  }

  if (!read_field(in, "agents", count)) return std::nullopt;
  for (std::size_t i = 0; i < count; ++i) {
    Agent a;
    int phase = 0;
    std::size_t path_len = 0;
    if (!(in >> a.id) || !read_trip(in, a.trip) || !trip_ok(a.trip)) return std::nullopt;
    if (!(in >> phase >> a.speed_permille >> a.route >> a.board_stop >> a.alight_stop >> a.bus
             >> a.path_idx >> a.offset_mm >> path_len)) {
      return std::nullopt;
    }
    if (phase < 0 || phase > static_cast<int>(Phase::Riding)) return std::nullopt;
    a.phase = static_cast<Phase>(phase);
    if (path_len > n_roads * 4) return std::nullopt;
    a.path.resize(path_len);
    for (auto& r : a.path) {
      if (!(in >> r) || r >= n_roads) return std::nullopt;
    }
    if (a.phase == Phase::Moving && a.path_idx >= a.path.size()) return std::nullopt;
    if (a.phase != Phase::Moving) {
      if (a.route >= sim.routes_.size()) return std::nullopt;
      const auto n_stops = sim.routes_[a.route].stops.size();
      if (a.board_stop >= n_stops || a.alight_stop >= n_stops) return std::nullopt;
    }
    sim.agents_.push_back(std::move(a));
  }

  if (!read_field(in, "buses", count)) return std::nullopt;
  sim.buses_.clear();
  for (std::size_t i = 0; i < count; ++i) {
    Bus b;
    std::int64_t left_at = 0;
    if (!(in >> b.id >> b.route >> b.next_stop >> b.path_idx >> b.offset_mm >> b.dwell_ticks >> left_at)) {
      return std::nullopt;
    }
    if (b.route >= sim.routes_.size() || !sim.routes_[b.route].viable) return std::nullopt;
    if (b.next_stop >= sim.routes_[b.route].stops.size() || left_at < 0) return std::nullopt;
    b.left_stop_at = Clock::from_ticks(left_at);
    sim.buses_.push_back(b);
  }

  if (!read_field(in, "finished", count)) return std::nullopt;
  for (std::size_t i = 0; i < count; ++i) {
    TripRecord t;
    int mode = 0;
    std::int64_t ticks = 0;
    if (!(in >> t.agent >> mode >> ticks)) return std::nullopt;
    if (mode < 0 || mode > static_cast<int>(TripMode::Drive)) return std::nullopt;
    t.mode = static_cast<TripMode>(mode);
    t.duration = Duration::from_ticks(ticks);
    sim.finished_.record(t);
  }

  if (!read_field(in, "bus_legs", count)) return std::nullopt;
  for (std::size_t i = 0; i < count; ++i) {
    BusLeg l;
    std::int64_t ticks = 0;
    if (!(in >> std::quoted(l.route) >> l.from_stop >> l.to_stop >> ticks)) return std::nullopt;
    l.duration = Duration::from_ticks(ticks);
    sim.bus_legs_.push_back(std::move(l));
  }

  if (!expect(in, "end")) return std::nullopt;
  return sim;
}

} // namespace tsim
