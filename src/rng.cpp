#include <tsim/rng.hpp>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tsim {

RandomStream RandomStream::seeded(std::uint64_t seed) {
  return RandomStream(seed);
}

RandomStream RandomStream::from_entropy() {
  std::random_device rd;
  const std::uint64_t seed = (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
  spdlog::warn("No RNG seed given; seeding from entropy ({}). This run can't be reproduced "
               "or compared against a baseline.", seed);
  return RandomStream(seed);
}

std::uint64_t RandomStream::next_u64_() {
  ++draws_;
  return engine_();
}

std::int64_t RandomStream::uniform(std::int64_t lo, std::int64_t hi) {
  if (hi <= lo) throw std::invalid_argument("RandomStream::uniform: empty range");
  const std::uint64_t span = static_cast<std::uint64_t>(hi) - static_cast<std::uint64_t>(lo);
  // Reject the low 2^64 mod span values so every residue is equally likely.
  const std::uint64_t threshold = (0 - span) % span;
  std::uint64_t x = next_u64_();
  while (x < threshold) x = next_u64_();
  return static_cast<std::int64_t>(static_cast<std::uint64_t>(lo) + x % span);
}

void RandomStream::write_state(std::ostream& out) const {
  out << seed_ << ' ' << draws_ << ' ' << engine_;
}

bool RandomStream::read_state(std::istream& in) {
  std::uint64_t seed = 0, draws = 0;
  std::mt19937_64 engine;
  if (!(in >> seed >> draws >> engine)) return false;
  seed_ = seed;
  draws_ = draws;
  engine_ = engine;
  return true;
}

} // namespace tsim
