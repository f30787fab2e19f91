#pragma once
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace tsim {

// One tick is a tenth of a simulated second.
inline constexpr std::int64_t kTicksPerSecond = 10;

// Signed span of simulated time, counted in ticks.
class Duration {
public:
  constexpr Duration() = default;

  static constexpr Duration zero() { return Duration(0); }
  static constexpr Duration from_ticks(std::int64_t t) { return Duration(t); }
  // These throw std::overflow_error instead of wrapping.
  static Duration seconds(std::int64_t s);
  static Duration minutes(std::int64_t m);
  static Duration hours(std::int64_t h);
  // Same syntax as Clock::parse; always non-negative.
  static std::optional<Duration> parse(std::string_view text);

  constexpr std::int64_t ticks() const { return ticks_; }
  double to_seconds() const { return static_cast<double>(ticks_) / kTicksPerSecond; }

  std::optional<Duration> checked_add(Duration o) const;
  std::optional<Duration> checked_sub(Duration o) const;
  Duration operator+(Duration o) const;
  Duration operator-(Duration o) const;

  // e.g. "1h02m03.4s", "-45.0s"
  std::string to_string() const;

  constexpr auto operator<=>(const Duration&) const = default;

private:
  explicit constexpr Duration(std::int64_t t) : ticks_(t) {}
  std::int64_t ticks_ = 0;
};

// Absolute simulated time since the start of a run. Never negative.
class Clock {
public:
  constexpr Clock() = default;

  static constexpr Clock zero() { return Clock(0); }
  static constexpr Clock end_of_day() { return Clock(24 * 3600 * kTicksPerSecond); }
  static Clock from_seconds(std::int64_t s);
  // Throws std::out_of_range for negative ticks.
  static Clock from_ticks(std::int64_t t);

  // Accepts H:MM:SS.S, H:MM:SS, MM:SS and SS[.S]. Returns nullopt on
  // anything else; callers decide how to report it.
  static std::optional<Clock> parse(std::string_view text);
  // HH:MM:SS.S, hours may exceed 23.
  std::string format() const;

  constexpr std::int64_t ticks() const { return ticks_; }

  std::optional<Clock> checked_add(Duration d) const;
  Clock operator+(Duration d) const;   // throws std::overflow_error
  Clock& operator+=(Duration d);
  Duration operator-(Clock o) const;

  constexpr auto operator<=>(const Clock&) const = default;

private:
  explicit constexpr Clock(std::int64_t t) : ticks_(t) {}
  std::int64_t ticks_ = 0;
};

} // namespace tsim
