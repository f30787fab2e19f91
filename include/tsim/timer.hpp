#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace tsim {

// Nested phase timer for batch operations. Each finished phase is logged.
class Timer {
public:
  explicit Timer(std::string name);
  ~Timer();
  Timer(const Timer&) = delete;
  Timer& operator=(const Timer&) = delete;

  void start(const std::string& phase);
  // Phases must be stopped in reverse start order.
  void stop(const std::string& phase);

  std::size_t depth() const { return open_.size(); }

private:
  using clock = std::chrono::steady_clock;
  struct Phase { std::string name; clock::time_point started; };

  std::string name_;
  clock::time_point started_;
  std::vector<Phase> open_;
};

} // namespace tsim
