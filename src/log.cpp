#include <tsim/log.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tsim {

void init_logging(const std::string& app_name, bool verbose) {
  auto logger = spdlog::stderr_color_mt(app_name);
  logger->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::cfg::load_env_levels();
}

} // namespace tsim
