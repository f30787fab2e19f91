#include <tsim/timer.hpp>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tsim {

static double seconds_since(std::chrono::steady_clock::time_point t0) {
  const auto dt = std::chrono::steady_clock::now() - t0;
  return std::chrono::duration<double>(dt).count();
}

Timer::Timer(std::string name) : name_(std::move(name)), started_(clock::now()) {
  spdlog::debug("{}: begin", name_);
}

Timer::~Timer() {
  for (auto it = open_.rbegin(); it != open_.rend(); ++it) {
    spdlog::warn("{}: phase '{}' never stopped", name_, it->name);
  }
  spdlog::info("{}: done in {:.3f}s", name_, seconds_since(started_));
}

void Timer::start(const std::string& phase) {
  spdlog::info("{}- {}", std::string(open_.size() * 2, ' '), phase);
  open_.push_back(Phase{phase, clock::now()});
}

void Timer::stop(const std::string& phase) {
  if (open_.empty() || open_.back().name != phase) {
    throw std::logic_error("Timer " + name_ + ": stop('" + phase + "') doesn't match the open phase");
  }
  const double took = seconds_since(open_.back().started);
  open_.pop_back();
  spdlog::info("{}- {} took {:.3f}s", std::string(open_.size() * 2, ' '), phase, took);
}

} // namespace tsim
