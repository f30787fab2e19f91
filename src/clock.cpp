#include <tsim/clock.hpp>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <vector>

namespace tsim {

static bool add_overflows(std::int64_t a, std::int64_t b) {
  if (b > 0) return a > std::numeric_limits<std::int64_t>::max() - b;
  return a < std::numeric_limits<std::int64_t>::min() - b;
}

static std::int64_t scale_checked(std::int64_t v, std::int64_t factor) {
  constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
  constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
  if (v > kMax / factor || v < kMin / factor) {
    throw std::overflow_error("Duration out of range");
  }
  return v * factor;
}

Duration Duration::seconds(std::int64_t s) { return Duration(scale_checked(s, kTicksPerSecond)); }
Duration Duration::minutes(std::int64_t m) { return Duration(scale_checked(m, 60 * kTicksPerSecond)); }
Duration Duration::hours(std::int64_t h) { return Duration(scale_checked(h, 3600 * kTicksPerSecond)); }

std::optional<Duration> Duration::parse(std::string_view text) {
  const auto c = Clock::parse(text);
  if (!c) return std::nullopt;
  return Duration(c->ticks());
}

std::optional<Duration> Duration::checked_add(Duration o) const {
  if (add_overflows(ticks_, o.ticks_)) return std::nullopt;
  return Duration(ticks_ + o.ticks_);
}

std::optional<Duration> Duration::checked_sub(Duration o) const {
  if (o.ticks_ == std::numeric_limits<std::int64_t>::min()) return std::nullopt;
  return checked_add(Duration(-o.ticks_));
}

Duration Duration::operator+(Duration o) const {
  if (auto r = checked_add(o)) return *r;
  throw std::overflow_error("Duration addition overflow");
}

Duration Duration::operator-(Duration o) const {
  if (auto r = checked_sub(o)) return *r;
  throw std::overflow_error("Duration subtraction overflow");
}

std::string Duration::to_string() const {
  // Magnitude as unsigned so INT64_MIN formats too.
  const bool neg = ticks_ < 0;
  const std::uint64_t mag = neg ? (~static_cast<std::uint64_t>(ticks_) + 1u)
                                : static_cast<std::uint64_t>(ticks_);
  const std::uint64_t tenths = mag % kTicksPerSecond;
  const std::uint64_t total_s = mag / kTicksPerSecond;
  const std::uint64_t h = total_s / 3600;
  const std::uint64_t m = (total_s / 60) % 60;
  const std::uint64_t s = total_s % 60;

  char buf[64];
  if (h > 0) {
    std::snprintf(buf, sizeof(buf), "%s%lluh%02llum%02llu.%llus", neg ? "-" : "",
                  (unsigned long long)h, (unsigned long long)m, (unsigned long long)s,
                  (unsigned long long)tenths);
  } else if (m > 0) {
    std::snprintf(buf, sizeof(buf), "%s%llum%02llu.%llus", neg ? "-" : "",
                  (unsigned long long)m, (unsigned long long)s, (unsigned long long)tenths);
  } else {
    std::snprintf(buf, sizeof(buf), "%s%llu.%llus", neg ? "-" : "",
                  (unsigned long long)s, (unsigned long long)tenths);
  }
  return buf;
}

Clock Clock::from_seconds(std::int64_t s) {
  return from_ticks(Duration::seconds(s).ticks());
}

Clock Clock::from_ticks(std::int64_t t) {
  if (t < 0) throw std::out_of_range("Clock can't be negative");
  return Clock(t);
}

// Field of 1..9 digits; 9 keeps every combination below INT64_MAX.
static std::optional<std::int64_t> parse_digits(std::string_view s) {
  if (s.empty() || s.size() > 9) return std::nullopt;
  std::int64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    v = v * 10 + (c - '0');
  }
  return v;
}

std::optional<Clock> Clock::parse(std::string_view text) {
  std::vector<std::string_view> parts;
  std::size_t begin = 0;
  for (std::size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == ':') {
      parts.push_back(text.substr(begin, i - begin));
      begin = i + 1;
    }
  }
  if (parts.empty() || parts.size() > 3) return std::nullopt;

  // Seconds, optionally with exactly one fractional digit.
  std::string_view sec_field = parts.back();
  std::int64_t tenths = 0;
  if (const auto dot = sec_field.find('.'); dot != std::string_view::npos) {
    const auto frac = sec_field.substr(dot + 1);
    if (frac.size() != 1 || frac[0] < '0' || frac[0] > '9') return std::nullopt;
    tenths = frac[0] - '0';
    sec_field = sec_field.substr(0, dot);
  }
  const auto secs = parse_digits(sec_field);
  if (!secs) return std::nullopt;

  std::int64_t total_s = 0;
  if (parts.size() == 1) {
    total_s = *secs;
  } else {
    if (*secs >= 60) return std::nullopt;
    const auto mins = parse_digits(parts[parts.size() - 2]);
    if (!mins) return std::nullopt;
    if (parts.size() == 3) {
      if (*mins >= 60) return std::nullopt;
      const auto hours = parse_digits(parts[0]);
      if (!hours) return std::nullopt;
      total_s = *hours * 3600 + *mins * 60 + *secs;
    } else {
      total_s = *mins * 60 + *secs;
    }
  }
  return Clock(total_s * kTicksPerSecond + tenths);
}

std::string Clock::format() const {
  const std::int64_t tenths = ticks_ % kTicksPerSecond;
  const std::int64_t total_s = ticks_ / kTicksPerSecond;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld.%lld",
                (long long)(total_s / 3600), (long long)((total_s / 60) % 60),
                (long long)(total_s % 60), (long long)tenths);
  return buf;
}

std::optional<Clock> Clock::checked_add(Duration d) const {
  if (add_overflows(ticks_, d.ticks())) return std::nullopt;
  const std::int64_t t = ticks_ + d.ticks();
  if (t < 0) return std::nullopt;
  return Clock(t);
}

Clock Clock::operator+(Duration d) const {
  if (auto r = checked_add(d)) return *r;
  throw std::overflow_error("Clock " + format() + " + " + d.to_string() + " out of range");
}

Clock& Clock::operator+=(Duration d) {
  *this = *this + d;
  return *this;
}

Duration Clock::operator-(Clock o) const {
  // Both sides are non-negative, so this can't overflow.
  return Duration::from_ticks(ticks_ - o.ticks_);
}

} // namespace tsim
