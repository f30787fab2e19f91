#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <limits>
#include <stdexcept>

#include <tsim/clock.hpp>

using Catch::Approx;
using namespace tsim;

TEST_CASE("Clock::parse accepts the documented forms") {
  SECTION("H:MM:SS.S") {
    auto t = Clock::parse("1:02:03.4");
    REQUIRE(t.has_value());
    REQUIRE(t->ticks() == (3600 + 2 * 60 + 3) * 10 + 4);
  }

  SECTION("H:MM:SS without a fraction") {
    auto t = Clock::parse("08:15:00");
    REQUIRE(t.has_value());
    REQUIRE(*t == Clock::from_seconds(8 * 3600 + 15 * 60));
  }

  SECTION("MM:SS") {
    auto t = Clock::parse("5:30");
    REQUIRE(t.has_value());
    REQUIRE(*t == Clock::from_seconds(330));
  }

  SECTION("bare seconds, fraction optional") {
    REQUIRE(Clock::parse("90") == Clock::from_seconds(90));
    REQUIRE(Clock::parse("0.5")->ticks() == 5);
  }

  SECTION("hours may exceed a day") {
    REQUIRE(Clock::parse("30:00:00") == Clock::from_seconds(30 * 3600));
  }
}

TEST_CASE("Clock::parse rejects malformed text") {
  for (const char* bad : {"", "abc", "1:2:3:4", "1:60:00", "1:00:60", "10:61", "1:00:00.",
                          "1:00:00.45", "-5", "1::00", "12:3a", " 12", "1234567890"}) {
    INFO(bad);
    REQUIRE_FALSE(Clock::parse(bad).has_value());
  }
}

TEST_CASE("Clock format and parse round trip") {
  for (std::int64_t ticks : {0LL, 1LL, 9LL, 10LL, 599LL, 36000LL, 863999LL, 864000LL, 1234567LL}) {
    const Clock c = Clock::from_ticks(ticks);
    INFO(c.format());
    auto back = Clock::parse(c.format());
    REQUIRE(back.has_value());
    REQUIRE(*back == c);
  }
  REQUIRE(Clock::from_ticks(36004).format() == "01:00:00.4");
  REQUIRE(Clock::end_of_day().format() == "24:00:00.0");
}

TEST_CASE("Clock arithmetic") {
  const Clock t = Clock::from_seconds(100);

  SECTION("adding and subtracting durations") {
    REQUIRE(t + Duration::seconds(20) == Clock::from_seconds(120));
    REQUIRE(Clock::from_seconds(120) - t == Duration::seconds(20));
    REQUIRE(t - Clock::from_seconds(120) == Duration::seconds(-20));
    Clock u = t;
    u += Duration::minutes(1);
    REQUIRE(u == Clock::from_seconds(160));
  }

  SECTION("never goes negative") {
    REQUIRE_FALSE(t.checked_add(Duration::seconds(-101)).has_value());
    REQUIRE_THROWS_AS(t + Duration::seconds(-101), std::overflow_error);
    REQUIRE_THROWS_AS(Clock::from_ticks(-1), std::out_of_range);
  }

  SECTION("overflow is reported, not wrapped") {
    const Clock far = Clock::from_ticks(std::numeric_limits<std::int64_t>::max() - 5);
    REQUIRE_FALSE(far.checked_add(Duration::from_ticks(10)).has_value());
    REQUIRE_THROWS_AS(Duration::hours(std::numeric_limits<std::int64_t>::max() / 1000),
                      std::overflow_error);
  }

  SECTION("ordering") {
    REQUIRE(Clock::zero() < t);
    REQUIRE(t < Clock::end_of_day());
  }
}

TEST_CASE("Duration formatting and units") {
  REQUIRE(Duration::seconds(1).ticks() == kTicksPerSecond);
  REQUIRE(Duration::minutes(2) == Duration::seconds(120));
  REQUIRE(Duration::hours(1) == Duration::minutes(60));
  REQUIRE(Duration::from_ticks(15).to_seconds() == Approx(1.5));

  REQUIRE(Duration::from_ticks(37234).to_string() == "1h02m03.4s");
  REQUIRE(Duration::seconds(75).to_string() == "1m15.0s");
  REQUIRE(Duration::from_ticks(-450).to_string() == "-45.0s");
  REQUIRE(Duration::zero().to_string() == "0.0s");

  REQUIRE(Duration::parse("1:30") == Duration::seconds(90));
  REQUIRE_FALSE(Duration::parse("soon").has_value());
}
